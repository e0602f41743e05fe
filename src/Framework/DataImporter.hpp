//////////////////////////////////////////////////////////////////////////
// ./src/Framework/DataImporter.hpp				        //
// Copyright Chris Jewell <chrism0dwk@gmail.com> 2012		        //
// 								        //
// This file is part of EpiSpread.				        //
// 								        //
// EpiSpread is free software: you can redistribute it and/or modify    //
// it under the terms of the GNU General Public License as published by //
// the Free Software Foundation, either version 3 of the License, or    //
// (at your option) any later version.				        //
// 								        //
// EpiSpread is distributed in the hope that it will be useful,	        //
// but WITHOUT ANY WARRANTY; without even the implied warranty of       //
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the        //
// GNU General Public License for more details.			        //
// 								        //
// You should have received a copy of the GNU General Public License    //
// along with EpiSpread.  If not, see <http://www.gnu.org/licenses/>.   //
//////////////////////////////////////////////////////////////////////////


#ifndef DATAIMPORTER_HPP_
#define DATAIMPORTER_HPP_

#include <string>
#include <vector>

#include "EpiSpreadException.hpp"

namespace EpiSpread
{
  /*! \brief Interface to a record-by-record data source
   *
   * next() throws fileEOF once the source is exhausted.
   */
  template < class T >
  class DataImporter
  {
  public:
    typedef T DataType;
    struct Record
     {
       std::string id;
       T data;
     };

    DataImporter() {};

    virtual
    ~DataImporter() {};

    virtual
    void
    open() = 0;

    virtual
    void
    close() = 0;

    virtual
    Record
    next() = 0;

    virtual
    void
    reset() = 0;
  };

  /*! Reads every record of importer, in order, into data
   *
   * @param importer an unopened importer
   * @param data cleared, then filled with the imported records
   */
  template < class T >
  void
  importAll(DataImporter<T>& importer, std::vector<T>& data)
  {
    data.clear();
    importer.open();
    try
      {
        while (1)
          {
            typename DataImporter<T>::Record record = importer.next();
            data.push_back(record.data);
          }
      }
    catch (fileEOF& e)
      {
        // Normal termination
      }
    importer.close();
  }

}

#endif /* DATAIMPORTER_HPP_ */
