/*************************************************************************
 *  ./src/data/TimeseriesWriter.hpp
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
 * TimeseriesWriter.hpp
 *
 *  Export of a recorded timeseries to file.
 */

#ifndef TIMESERIESWRITER_HPP_
#define TIMESERIESWRITER_HPP_

#include <fstream>
#include <string>

#include "Timeseries.hpp"

namespace EpiSpread
{

  /*! \brief Base class for timeseries file writers
   *
   * Usage is open(), write() one or more times, close().
   */
  class TimeseriesWriter
  {
  protected:
    std::ofstream file_;
    std::string filename_;

  public:
    TimeseriesWriter(const std::string filename);
    virtual
    ~TimeseriesWriter();
    //! @throws output_exception if the file cannot be opened
    virtual
    void
    open();
    virtual
    void
    close();
    virtual
    void
    write(const Timeseries& timeseries) = 0;
  };


  //! Comma separated values, one row per sample after a header row
  class CsvTimeseriesWriter : public TimeseriesWriter
  {
  public:
    CsvTimeseriesWriter(const std::string filename);
    void
    write(const Timeseries& timeseries);
  };


  //! A JSON array of objects with numeric members
  class JsonTimeseriesWriter : public TimeseriesWriter
  {
  public:
    JsonTimeseriesWriter(const std::string filename);
    void
    write(const Timeseries& timeseries);
  };


  void
  writeCsv(std::ostream& os, const Timeseries& timeseries);
  void
  writeJson(std::ostream& os, const Timeseries& timeseries);

}

#endif /* TIMESERIESWRITER_HPP_ */
