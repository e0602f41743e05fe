/*************************************************************************
 *  ./src/Framework/types.hpp
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

// Types used throughout the agent simulation code


#ifndef INCLUDE_EPISPREADTYPES_HPP
#define INCLUDE_EPISPREADTYPES_HPP

#include <cstddef>

namespace EpiSpread
{

  typedef double simTime_t;
  typedef unsigned int agentId_t;

  //! A position or direction in the simulation field
  struct Point {
    double x;
    double y;
  };

  //! Axis-aligned simulation field, origin at (0,0)
  struct Bounds {
    double width;
    double height;
  };

}
#endif
