/*************************************************************************
 *  ./src/data/Data.hpp
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
 * Data.hpp
 *
 *  Importers for previously recorded timeseries.
 */

#ifndef DATA_HPP_
#define DATA_HPP_

#include <fstream>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

#include "types.hpp"
#include "DataImporter.hpp"
#include "Timeseries.hpp"

namespace EpiSpread
{

  /*! \brief Reads a timeseries from a CSV file
   *
   * The first line is a header naming the columns.  Any of t,
   * healthy, infected, asymptomatic, recovered and vaccinated may
   * appear, in any order; unknown columns are ignored and absent
   * ones read as zero.  Blank lines are skipped.
   */
  class CsvTimeseriesImporter : public DataImporter<Sample>
  {
  private:
    std::ifstream dataFile_;
    std::string filename_;
    std::vector<int> columns_;
    size_t row_;

    void
    readHeader();

  public:
    CsvTimeseriesImporter(const std::string filename);
    virtual ~CsvTimeseriesImporter();
    void open();
    void close();
    Record next();
    void reset();
  };


  /*! \brief Reads a timeseries from a JSON file
   *
   * The document must be an array of objects.  Object members are
   * matched by name as for the CSV importer.
   */
  class JsonTimeseriesImporter : public DataImporter<Sample>
  {
  private:
    std::string filename_;
    boost::property_tree::ptree document_;
    boost::property_tree::ptree::const_iterator cursor_;
    size_t row_;
    bool isOpen_;

  public:
    JsonTimeseriesImporter(const std::string filename);
    virtual ~JsonTimeseriesImporter();
    void open();
    void close();
    Record next();
    void reset();
  };


  //! Column index of a timeseries field name, or -1 if unknown
  int
  timeseriesField(const std::string& name);

  /*! Sets field number field of sample from a text value
   *
   * Values are coerced with stlStrToDouble(), so anything that is
   * not a finite number is stored as zero.
   */
  void
  setTimeseriesField(Sample& sample, const int field, const std::string& value);

}

#endif /* DATA_HPP_ */
