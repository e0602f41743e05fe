/*************************************************************************
 *  ./src/Framework/Configuration.hpp
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
 * Configuration.hpp
 *
 *  Parameter set for one simulation run.
 */

#ifndef CONFIGURATION_HPP_
#define CONFIGURATION_HPP_

#include <string>
#include <vector>
#include <boost/property_tree/ptree_fwd.hpp>

#include "types.hpp"
#include "EpiSpreadException.hpp"

namespace EpiSpread
{

  /// \name Engine constants
  //@{
  //! Distance units per second travelled at unit speed
  const double SPEED_CONSTANT = 50.0;
  //! Half-width of the per-step velocity perturbation
  const double VELOCITY_JITTER = 0.02;
  //! Lower bound on the spatial grid cell size
  const double MIN_CELL_SIZE = 24.0;
  //! Simulated seconds between timeseries samples
  const double SAMPLE_INTERVAL = 0.5;
  //! Distance kept from the field edge when placing agents
  const double SPAWN_MARGIN = 10.0;
  //! Seeding gives up after this many draws per agent
  const size_t SEED_ATTEMPTS_PER_AGENT = 5;
  //! Transmission multiplier for super-spreading sources
  const double SUPER_SPREADER_MULTIPLIER = 2.0;
  const size_t DEFAULT_TRAIL_LENGTH = 8;
  //! Largest spatial grid a field may require, in cells
  const double MAX_GRID_CELLS = 4194304.0;
  //@}

  /*! \brief Parameters of a simulation run
   *
   * A plain value type.  Defaults give the standard
   * scenario: 120 agents, 3 seeds, radius 14 in an 800x600 field.
   * Fractions and probabilities are on [0,1].
   */
  struct Configuration
  {
    typedef std::vector<agentId_t> IdList;

    size_t population;
    size_t initialInfected;
    double speed;
    double infectionRadius;
    double baseProbability;
    double recoveryTime;
    double incubationTime;
    double vaccinatedFraction;
    double asymptomaticFraction;
    double fieldWidth;
    double fieldHeight;
    size_t trailLength;
    IdList superSpreaders;

    Configuration();

    /*! Checks the parameter set
     *
     * @throws configuration_error naming the first offending parameter
     */
    void
    validate() const;

    /*! Overwrites parameters present under path in pt
     *
     * Keys absent from the tree keep their current values, so
     * a file need only mention what it changes.
     * @param pt a property tree, usually read from XML
     * @param path the node holding the parameter keys
     */
    void
    load(const boost::property_tree::ptree& pt, const std::string& path);

    //! Reads epispread.parameters from an XML file
    void
    loadXml(const std::string& filename);

    Bounds
    getBounds() const;
  };

  /*! Applies a named scenario on top of config
   *
   * Known presets are "default", "fast", "vaccination" and "low".
   * @throws configuration_error if name is not a known preset
   */
  void
  applyPreset(Configuration& config, const std::string& name);

  //! Grid cell size guaranteeing the 3x3 neighbourhood covers radius
  double
  gridCellSize(const double infectionRadius);

}

#endif /* CONFIGURATION_HPP_ */
