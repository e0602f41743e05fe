/*************************************************************************
 *  ./src/data/TimeseriesWriter.cpp
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
 * TimeseriesWriter.cpp
 */

#include <sstream>

#include "TimeseriesWriter.hpp"
#include "EpiSpreadException.hpp"

#define OUTPUT_PRECISION 15

namespace EpiSpread
{

  TimeseriesWriter::TimeseriesWriter(const std::string filename) :
    filename_(filename)
  {
  }

  TimeseriesWriter::~TimeseriesWriter()
  {
    if(file_.is_open()) file_.close();
  }

  void
  TimeseriesWriter::open()
  {
    file_.open(filename_.c_str(), std::ios::out);
    if(!file_.is_open()) {
        std::stringstream msg;
        msg << "Cannot open timeseries file '" << filename_ << "' for writing";
        throw output_exception(msg.str());
    }
    file_.precision(OUTPUT_PRECISION);
  }

  void
  TimeseriesWriter::close()
  {
    if(file_.is_open()) file_.close();
  }


  CsvTimeseriesWriter::CsvTimeseriesWriter(const std::string filename) :
    TimeseriesWriter(filename)
  {
  }

  void
  CsvTimeseriesWriter::write(const Timeseries& timeseries)
  {
    if(!file_.is_open()) throw output_exception("Timeseries file '" + filename_ + "' is not open");
    writeCsv(file_, timeseries);
    if(file_.fail()) throw output_exception("Error writing to '" + filename_ + "'");
  }


  JsonTimeseriesWriter::JsonTimeseriesWriter(const std::string filename) :
    TimeseriesWriter(filename)
  {
  }

  void
  JsonTimeseriesWriter::write(const Timeseries& timeseries)
  {
    if(!file_.is_open()) throw output_exception("Timeseries file '" + filename_ + "' is not open");
    writeJson(file_, timeseries);
    if(file_.fail()) throw output_exception("Error writing to '" + filename_ + "'");
  }


  void
  writeCsv(std::ostream& os, const Timeseries& timeseries)
  {
    os << "t,healthy,infected,asymptomatic,recovered,vaccinated\n";
    for(Timeseries::const_iterator it = timeseries.begin();
        it != timeseries.end();
        ++it)
      {
        os << it->t << ","
           << it->healthy << ","
           << it->infected << ","
           << it->asymptomatic << ","
           << it->recovered << ","
           << it->vaccinated << "\n";
      }
  }

  void
  writeJson(std::ostream& os, const Timeseries& timeseries)
  {
    os << "[";
    for(Timeseries::const_iterator it = timeseries.begin();
        it != timeseries.end();
        ++it)
      {
        if(it != timeseries.begin()) os << ",";
        os << "\n  {\"t\": " << it->t
           << ", \"healthy\": " << it->healthy
           << ", \"infected\": " << it->infected
           << ", \"asymptomatic\": " << it->asymptomatic
           << ", \"recovered\": " << it->recovered
           << ", \"vaccinated\": " << it->vaccinated << "}";
      }
    os << "\n]\n";
  }

}
