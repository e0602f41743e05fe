/***************************************************************************
 *   Copyright (C) 2010 by Chris Jewell                                    *
 *   chris.jewell@warwick.ac.uk                                            *
 *                                                                         *
 *   This program is free software; you can redistribute it and/or modify  *
 *   it under the terms of the GNU General Public License as published by  *
 *   the Free Software Foundation; either version 2 of the License, or     *
 *   (at your option) any later version.                                   *
 *                                                                         *
 *   This program is distributed in the hope that it will be useful,       *
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
 *   GNU General Public License for more details.                          *
 *                                                                         *
 *   You should have received a copy of the GNU General Public License     *
 *   along with this program; if not, write to the                         *
 *   Free Software Foundation, Inc.,                                       *
 *   59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.             *
 ***************************************************************************/

/*
 * EpiSpreadException.hpp
 *
 *  Exceptions thrown by the simulation engine and its importers
 *  and writers.  Each keeps its own copy of the message so that
 *  callers may build messages in temporaries.
 */

#ifndef EPISPREADEXCEPTION_HPP_
#define EPISPREADEXCEPTION_HPP_

#include <exception>
#include <string>

namespace EpiSpread {

  class data_exception : public std::exception
  {
  public:
    data_exception(const std::string& msg) : msg_(msg) {}
    virtual ~data_exception() throw() {}
    virtual const char* what() const throw()
    {
      return msg_.c_str();
    }

  private:
    std::string msg_;
  };


  class output_exception : public std::exception
  {
  public:
    output_exception(const std::string& msg) : msg_(msg) {}
    virtual ~output_exception() throw() {}
    virtual const char* what() const throw()
    {
      return msg_.c_str();
    }

  private:
    std::string msg_;
  };


  class parse_exception : public std::exception
   {
   public:
     parse_exception(const std::string& msg) : msg_(msg) {}
     virtual ~parse_exception() throw() {}
     virtual const char* what() const throw()
     {
       return msg_.c_str();
     }

   private:
     std::string msg_;
   };

  class range_exception : public std::exception
     {
     public:
       range_exception(const std::string& msg) : msg_("Range exception: " + msg) {}
       virtual ~range_exception() throw() {}
       virtual const char* what() const throw()
       {
         return msg_.c_str();
       }

     private:
       std::string msg_;
     };

  //! Thrown when a parameter set cannot be used to run a simulation
  class configuration_error : public std::exception
  {
  public:
	  configuration_error(const std::string& msg) : msg_("Configuration error: " + msg) {}
	  virtual ~configuration_error() throw() {}
	  virtual const char* what() const throw()
		{
		  return msg_.c_str();
		}

  private:
	  std::string msg_;
  };

  class fileEOF : public std::exception
  {
  public:
    virtual const char* what() const throw()
    {
      return "End of file";
    }
  };




}


#endif /* EPISPREADEXCEPTION_HPP_ */
