/*************************************************************************
 *  ./src/Framework/Configuration.cpp
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
 * Configuration.cpp
 */

#include <algorithm>
#include <sstream>
#include <cmath>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <boost/foreach.hpp>

#include "Configuration.hpp"

namespace EpiSpread
{

  namespace
  {
    bool
    isFraction(const double x)
    {
      return x >= 0.0 && x <= 1.0;
    }
  }

  Configuration::Configuration() :
    population(120), initialInfected(3), speed(1.0), infectionRadius(14.0),
    baseProbability(0.45), recoveryTime(12.0), incubationTime(0.0),
    vaccinatedFraction(0.0), asymptomaticFraction(0.0),
    fieldWidth(800.0), fieldHeight(600.0), trailLength(DEFAULT_TRAIL_LENGTH)
  {
  }

  void
  Configuration::validate() const
  {
    // NaN fails every comparison, so test for the valid range
    // rather than the invalid one.
    if (population == 0)
      throw configuration_error("population must be greater than zero");
    if (!(infectionRadius > 0.0) || !std::isfinite(infectionRadius))
      throw configuration_error("infection radius must be greater than zero");
    if (!isFraction(baseProbability))
      throw configuration_error("base transmission probability must lie in [0,1]");
    if (!isFraction(vaccinatedFraction))
      throw configuration_error("vaccinated fraction must lie in [0,1]");
    if (!isFraction(asymptomaticFraction))
      throw configuration_error("asymptomatic fraction must lie in [0,1]");
    if (!(recoveryTime > 0.0))
      throw configuration_error("recovery time must be greater than zero");
    if (!(incubationTime >= 0.0))
      throw configuration_error("incubation time must not be negative");
    if (!(speed >= 0.0) || !std::isfinite(speed))
      throw configuration_error("speed must not be negative");
    if (!(fieldWidth > 0.0) || !(fieldHeight > 0.0)
        || !std::isfinite(fieldWidth) || !std::isfinite(fieldHeight))
      throw configuration_error("field dimensions must be greater than zero");

    // Computed in floating point, so a huge field cannot wrap the count
    double cellSize = gridCellSize(infectionRadius);
    double cols = std::ceil(fieldWidth / cellSize);
    double rows = std::ceil(fieldHeight / cellSize);
    if (cols > MAX_GRID_CELLS || rows > MAX_GRID_CELLS || cols * rows > MAX_GRID_CELLS)
      {
        std::stringstream msg;
        msg << "a " << fieldWidth << "x" << fieldHeight << " field at radius "
            << infectionRadius << " needs more than " << MAX_GRID_CELLS
            << " grid cells";
        throw configuration_error(msg.str());
      }

    for(IdList::const_iterator it = superSpreaders.begin();
        it != superSpreaders.end();
        ++it)
      {
        if (*it >= population) {
            std::stringstream msg;
            msg << "super-spreader id " << *it << " is outside a population of " << population;
            throw configuration_error(msg.str());
        }
      }
  }

  void
  Configuration::load(const boost::property_tree::ptree& pt, const std::string& path)
  {
    using boost::property_tree::ptree;

    population = pt.get<size_t> (path + ".population", population);
    initialInfected = pt.get<size_t> (path + ".initialinfected", initialInfected);
    speed = pt.get<double> (path + ".speed", speed);
    infectionRadius = pt.get<double> (path + ".radius", infectionRadius);
    baseProbability = pt.get<double> (path + ".baseprob", baseProbability);
    recoveryTime = pt.get<double> (path + ".recoverytime", recoveryTime);
    incubationTime = pt.get<double> (path + ".incubation", incubationTime);
    vaccinatedFraction = pt.get<double> (path + ".vaccinated", vaccinatedFraction);
    asymptomaticFraction = pt.get<double> (path + ".asymptomatic", asymptomaticFraction);
    fieldWidth = pt.get<double> (path + ".width", fieldWidth);
    fieldHeight = pt.get<double> (path + ".height", fieldHeight);
    trailLength = pt.get<size_t> (path + ".traillength", trailLength);

    boost::optional<const ptree&> spreaders = pt.get_child_optional(path + ".superspreaders");
    if (spreaders)
      {
        superSpreaders.clear();
        BOOST_FOREACH(const ptree::value_type& v, *spreaders)
          {
            if (v.first == "id")
              superSpreaders.push_back(v.second.get_value<agentId_t> ());
          }
      }
  }

  void
  Configuration::loadXml(const std::string& filename)
  {
    boost::property_tree::ptree pt;
    read_xml(filename, pt);
    load(pt, "epispread.parameters");
  }

  Bounds
  Configuration::getBounds() const
  {
    Bounds bounds;
    bounds.width = fieldWidth;
    bounds.height = fieldHeight;
    return bounds;
  }

  void
  applyPreset(Configuration& config, const std::string& name)
  {
    if (name == "default")
      {
        config = Configuration();
      }
    else if (name == "fast")
      {
        config.population = 200;
        config.baseProbability = 0.70;
        config.speed = 1.4;
        config.infectionRadius = 18.0;
      }
    else if (name == "vaccination")
      {
        config.vaccinatedFraction = 0.60;
        config.baseProbability = 0.20;
      }
    else if (name == "low")
      {
        config.baseProbability = 0.10;
        config.infectionRadius = 8.0;
      }
    else
      throw configuration_error("unknown preset '" + name + "'");
  }

  double
  gridCellSize(const double infectionRadius)
  {
    return std::max(MIN_CELL_SIZE, 2.0 * infectionRadius);
  }

}
