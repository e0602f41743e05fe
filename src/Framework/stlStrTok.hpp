/*************************************************************************
 *  ./src/Framework/stlStrTok.hpp
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

// Header file for STL std::string parser.  Splits delimited text
// and coerces loosely formatted numeric fields.

#ifndef STLSTRTOK_H
#define STLSTRTOK_H

#include <vector>
#include <string>

/*! Splits myString at delim, trimming whitespace from each token
 *
 * Empty fields are kept, so "a,,b" yields three tokens.
 */
void stlStrTok(std::vector<std::string>& tokens, const std::string& myString, const char delim = ',');

//! Removes leading and trailing whitespace (including '\r')
std::string stlStrTrim(const std::string& myString);

/*! Converts a field to a number, tolerantly
 *
 * Blank, unparsable, partly numeric and non-finite fields give 0.
 */
double stlStrToDouble(const std::string& myString);

#endif
