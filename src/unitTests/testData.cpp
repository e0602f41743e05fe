/*************************************************************************
 *  ./src/unitTests/testData.cpp
 *  Copyright Chris Jewell <chrism0dwk@gmail.com> 2012
 *
 *  This file is part of EpiSpread.
 *
 *  EpiSpread is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  EpiSpread is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with EpiSpread.  If not, see <http://www.gnu.org/licenses/>.
 *************************************************************************/
/*
 * testData.cpp
 */

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <catch2/catch.hpp>

#include "Data.hpp"
#include "TimeseriesWriter.hpp"
#include "stlStrTok.hpp"

using namespace EpiSpread;

namespace
{
  void
  writeFile(const char* filename, const std::string& contents)
  {
    std::ofstream file(filename);
    file << contents;
  }

  std::string
  readFile(const char* filename)
  {
    std::ifstream file(filename);
    std::stringstream contents;
    contents << file.rdbuf();
    return contents.str();
  }
}

const char* tag_data = "[data]";

TEST_CASE("tokenizer trims and keeps empty fields", tag_data) {
  std::vector<std::string> tokens;
  stlStrTok(tokens, " t , healthy,,infected\r", ',');
  REQUIRE(tokens.size() == 4);
  REQUIRE(tokens[0] == "t");
  REQUIRE(tokens[1] == "healthy");
  REQUIRE(tokens[2] == "");
  REQUIRE(tokens[3] == "infected");

  stlStrTok(tokens, "1,2,", ',');
  REQUIRE(tokens.size() == 3);
  REQUIRE(tokens[2] == "");
}

TEST_CASE("numeric fields coerce to zero when unusable", tag_data) {
  REQUIRE(stlStrToDouble("42") == 42.0);
  REQUIRE(stlStrToDouble(" 1.5 ") == 1.5);
  REQUIRE(stlStrToDouble("-3e2") == -300.0);
  REQUIRE(stlStrToDouble("") == 0.0);
  REQUIRE(stlStrToDouble("abc") == 0.0);
  REQUIRE(stlStrToDouble("12abc") == 0.0);
  REQUIRE(stlStrToDouble("inf") == 0.0);
  REQUIRE(stlStrToDouble("nan") == 0.0);
}

TEST_CASE("CSV import maps columns by header", tag_data) {
  const char* filename = "epispread_test_import.csv";
  writeFile(filename,
      "infected,t,healthy,notes,recovered\n"
      "5,0,95,first,0\n"
      "\n"
      "10,1,90,second,x\n"
      "  \n"
      "12.5,1.5,87.5\n");

  CsvTimeseriesImporter importer(filename);
  Timeseries ts;
  importAll(importer, ts);
  std::remove(filename);

  REQUIRE(ts.size() == 3);
  REQUIRE(ts[0].t == 0.0);
  REQUIRE(ts[0].healthy == 95.0);
  REQUIRE(ts[0].infected == 5.0);
  REQUIRE(ts[1].t == 1.0);
  REQUIRE(ts[1].recovered == 0.0);
  REQUIRE(ts[2].infected == 12.5);
  REQUIRE(ts[2].healthy == 87.5);
  REQUIRE(ts[2].vaccinated == 0.0);
  REQUIRE(ts[2].asymptomatic == 0.0);
}

TEST_CASE("CSV importer can be reset", tag_data) {
  const char* filename = "epispread_test_reset.csv";
  writeFile(filename, "t,healthy\n0,10\n1,9\n");

  CsvTimeseriesImporter importer(filename);
  importer.open();
  CsvTimeseriesImporter::Record first = importer.next();
  importer.next();
  CHECK_THROWS_AS(importer.next(), fileEOF);

  importer.reset();
  CsvTimeseriesImporter::Record again = importer.next();
  importer.close();
  std::remove(filename);

  REQUIRE(first.id == "0");
  REQUIRE(again.id == "0");
  REQUIRE(again.data == first.data);
}

TEST_CASE("JSON import reads an array of objects", tag_data) {
  const char* filename = "epispread_test_import.json";
  writeFile(filename,
      "[ {\"t\": 0, \"healthy\": 95, \"infected\": 5, \"recovered\": 0, \"vaccinated\": 0},\n"
      "  {\"t\": 1, \"healthy\": \"90\", \"infected\": 10, \"recovered\": null, \"extra\": 3} ]\n");

  JsonTimeseriesImporter importer(filename);
  Timeseries ts;
  importAll(importer, ts);
  std::remove(filename);

  REQUIRE(ts.size() == 2);
  REQUIRE(ts[0].healthy == 95.0);
  REQUIRE(ts[0].infected == 5.0);
  REQUIRE(ts[1].t == 1.0);
  REQUIRE(ts[1].healthy == 90.0);
  REQUIRE(ts[1].infected == 10.0);
  REQUIRE(ts[1].recovered == 0.0);
  REQUIRE(ts[1].vaccinated == 0.0);
}

TEST_CASE("JSON documents must be arrays", tag_data) {
  const char* filename = "epispread_test_object.json";
  writeFile(filename, "{\"t\": 0, \"healthy\": 95}");
  JsonTimeseriesImporter object(filename);
  CHECK_THROWS_AS(object.open(), parse_exception);

  writeFile(filename, "[ {\"t\": 0 ");
  JsonTimeseriesImporter truncated(filename);
  CHECK_THROWS_AS(truncated.open(), parse_exception);
  std::remove(filename);
}

TEST_CASE("missing import files are reported", tag_data) {
  CsvTimeseriesImporter csv("no_such_file.csv");
  CHECK_THROWS_AS(csv.open(), data_exception);

  JsonTimeseriesImporter json("no_such_file.json");
  CHECK_THROWS_AS(json.open(), data_exception);
}

TEST_CASE("CSV export writes a header and one row per sample", tag_data) {
  Timeseries ts;
  Sample s;
  s.t = 0.5;
  s.healthy = 95;
  s.infected = 4;
  s.asymptomatic = 1;
  ts.push_back(s);
  s.t = 1.0;
  s.recovered = 2;
  ts.push_back(s);

  const char* filename = "epispread_test_export.csv";
  CsvTimeseriesWriter writer(filename);
  writer.open();
  writer.write(ts);
  writer.close();

  std::string contents = readFile(filename);
  REQUIRE(contents ==
      "t,healthy,infected,asymptomatic,recovered,vaccinated\n"
      "0.5,95,4,1,0,0\n"
      "1,95,4,1,2,0\n");

  // What we write, we can read back
  CsvTimeseriesImporter importer(filename);
  Timeseries back;
  importAll(importer, back);
  std::remove(filename);
  REQUIRE(back == ts);
}

TEST_CASE("JSON export writes numeric members", tag_data) {
  Timeseries ts;
  Sample s;
  s.t = 0.5;
  s.healthy = 10;
  ts.push_back(s);

  std::stringstream out;
  writeJson(out, ts);
  REQUIRE(out.str() ==
      "[\n  {\"t\": 0.5, \"healthy\": 10, \"infected\": 0, \"asymptomatic\": 0,"
      " \"recovered\": 0, \"vaccinated\": 0}\n]\n");

  std::stringstream empty;
  writeJson(empty, Timeseries());
  REQUIRE(empty.str() == "[\n]\n");
}

TEST_CASE("unwritable export files are reported", tag_data) {
  CsvTimeseriesWriter writer("no_such_directory/out.csv");
  CHECK_THROWS_AS(writer.open(), output_exception);

  JsonTimeseriesWriter unopened("never_opened.json");
  CHECK_THROWS_AS(unopened.write(Timeseries()), output_exception);
}
