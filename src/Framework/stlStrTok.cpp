/*************************************************************************
 *  ./src/Framework/stlStrTok.cpp
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

// Function definitions for STL std::string parser.

#include <cmath>
#include <cstdlib>
#include <sstream>

#include "stlStrTok.hpp"

using namespace std;


void stlStrTok(std::vector<string>& tokens, const std::string& myString, const char delim)
{
  // Usage: vector<string> tokens - vector to contain parsed tokens
  //        const string myString - STL std::string containing string to be parsed
  //        char delim - delimiter for parsing

  std::istringstream ss(myString);
  std::string token;

  tokens.clear();

  while(getline(ss,token,delim)) {
    tokens.push_back(stlStrTrim(token));
  }

  // getline drops a trailing empty field
  if(!myString.empty() && myString[myString.size()-1] == delim)
    tokens.push_back("");

}

std::string stlStrTrim(const std::string& myString)
{
  const char* ws = " \t\r\n";
  size_t first = myString.find_first_not_of(ws);
  if(first == string::npos) return "";
  size_t last = myString.find_last_not_of(ws);
  return myString.substr(first, last - first + 1);
}

double stlStrToDouble(const std::string& myString)
{
  std::string field = stlStrTrim(myString);
  if(field.empty()) return 0.0;

  const char* begin = field.c_str();
  char* end = NULL;
  double value = strtod(begin, &end);

  // Reject partial parses such as "12abc"
  if(end == begin || *end != '\0') return 0.0;
  if(!std::isfinite(value)) return 0.0;
  return value;
}
