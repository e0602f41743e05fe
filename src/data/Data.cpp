/*************************************************************************
 *  ./src/data/Data.cpp
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
 * Data.cpp
 */

#include <algorithm>
#include <sstream>

#include <boost/property_tree/json_parser.hpp>
#include <boost/foreach.hpp>

#include "Data.hpp"
#include "stlStrTok.hpp"

namespace EpiSpread
{

  namespace
  {
    const char* fieldNames[] = { "t", "healthy", "infected", "asymptomatic",
        "recovered", "vaccinated" };
    const int NUM_FIELDS = 6;
  }

  int
  timeseriesField(const std::string& name)
  {
    for (int i = 0; i < NUM_FIELDS; ++i)
      if (name == fieldNames[i]) return i;
    return -1;
  }

  void
  setTimeseriesField(Sample& sample, const int field, const std::string& value)
  {
    double x = stlStrToDouble(value);
    switch (field)
      {
    case 0:
      sample.t = x;
      break;
    case 1:
      sample.healthy = x;
      break;
    case 2:
      sample.infected = x;
      break;
    case 3:
      sample.asymptomatic = x;
      break;
    case 4:
      sample.recovered = x;
      break;
    case 5:
      sample.vaccinated = x;
      break;
    default:
      break;
      }
  }


  CsvTimeseriesImporter::CsvTimeseriesImporter(const std::string filename) :
    filename_(filename), row_(0)
  {

  }

  CsvTimeseriesImporter::~CsvTimeseriesImporter()
  {
    if(dataFile_.is_open()) dataFile_.close();
  }

  void
  CsvTimeseriesImporter::open()
  {
    dataFile_.open(filename_.c_str(), std::ios::in);
    if(!dataFile_.is_open()) {
        std::stringstream msg;
        msg << "Cannot open timeseries file '" << filename_ << "' for reading";
        throw data_exception(msg.str());
    }

    readHeader();
  }

  void
  CsvTimeseriesImporter::readHeader()
  {
    std::string row;
    std::vector<std::string> tokens;

    columns_.clear();
    row_ = 0;

    // Header is the first non-blank line
    while(getline(dataFile_, row)) {
        if(!stlStrTrim(row).empty()) break;
    }

    stlStrTok(tokens, row, ',');
    for(std::vector<std::string>::const_iterator it = tokens.begin();
        it != tokens.end();
        ++it)
      columns_.push_back(timeseriesField(*it));
  }

  void
  CsvTimeseriesImporter::close()
  {
    dataFile_.close();
  }

  CsvTimeseriesImporter::Record
  CsvTimeseriesImporter::next()
  {
    std::string row;
    Record record;
    std::vector<std::string> tokens;

    do {
        if(!getline(dataFile_, row)) throw fileEOF();
    } while(stlStrTrim(row).empty());

    stlStrTok(tokens, row, ',');

    std::stringstream id;
    id << row_++;
    record.id = id.str();

    size_t n = std::min(tokens.size(), columns_.size());
    for(size_t i = 0; i < n; ++i)
      setTimeseriesField(record.data, columns_[i], tokens[i]);

    return record;
  }

  void
  CsvTimeseriesImporter::reset()
  {
    dataFile_.clear();
    dataFile_.seekg(0);
    readHeader();
  }



  JsonTimeseriesImporter::JsonTimeseriesImporter(const std::string filename) :
    filename_(filename), row_(0), isOpen_(false)
  {

  }

  JsonTimeseriesImporter::~JsonTimeseriesImporter()
  {
  }

  void
  JsonTimeseriesImporter::open()
  {
    using boost::property_tree::ptree;

    std::ifstream dataFile(filename_.c_str(), std::ios::in);
    if(!dataFile.is_open()) {
        std::stringstream msg;
        msg << "Cannot open timeseries file '" << filename_ << "' for reading";
        throw data_exception(msg.str());
    }

    ptree document;
    try
      {
        boost::property_tree::read_json(dataFile, document);
      }
    catch (boost::property_tree::json_parser_error& e)
      {
        std::stringstream msg;
        msg << "Malformed JSON in '" << filename_ << "': " << e.message()
            << " at line " << e.line();
        throw parse_exception(msg.str());
      }

    // Array elements are stored under empty keys
    if(!document.data().empty())
      throw parse_exception("Timeseries document in '" + filename_ + "' is not an array");
    BOOST_FOREACH(const ptree::value_type& element, document)
      {
        if(!element.first.empty())
          throw parse_exception("Timeseries document in '" + filename_ + "' is not an array");
      }

    document_.swap(document);
    isOpen_ = true;
    reset();
  }

  void
  JsonTimeseriesImporter::close()
  {
    document_.clear();
    isOpen_ = false;
  }

  JsonTimeseriesImporter::Record
  JsonTimeseriesImporter::next()
  {
    using boost::property_tree::ptree;

    if(!isOpen_ || cursor_ == document_.end()) throw fileEOF();

    Record record;
    std::stringstream id;
    id << row_++;
    record.id = id.str();

    BOOST_FOREACH(const ptree::value_type& member, cursor_->second)
      {
        setTimeseriesField(record.data, timeseriesField(member.first),
            member.second.data());
      }

    ++cursor_;
    return record;
  }

  void
  JsonTimeseriesImporter::reset()
  {
    cursor_ = document_.begin();
    row_ = 0;
  }

}
