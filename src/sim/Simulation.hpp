/*************************************************************************
 *  ./src/sim/Simulation.hpp
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
 * Simulation.hpp
 *
 *  Time-stepped agent-based epidemic simulation.
 */

#ifndef SIMULATION_HPP_
#define SIMULATION_HPP_

#include <iostream>
#include <vector>

#include "types.hpp"
#include "Random.hpp"
#include "Agent.hpp"
#include "SpatialGrid.hpp"
#include "Configuration.hpp"
#include "Timeseries.hpp"

namespace EpiSpread
{

  /*! \brief Agent-based epidemic simulation engine
   *
   * Owns a fixed population of moving agents and a spatial index
   * over them.  A driver calls init() once and then step()
   * repeatedly, supplying the simulated time elapsed per step.
   * Each step runs, in this order:
   *   -# movement, followed by a grid rebuild;
   *   -# infection spread, using post-movement positions;
   *   -# infection progression and recovery;
   *   -# sampling into the timeseries.
   *
   * All randomness is drawn from the Random instance given to the
   * constructor, so equal seeds and equal dt sequences give equal
   * runs.  The engine is not thread safe; distinct instances with
   * distinct Random objects share nothing.
   */
  class Simulation
  {
  public:
    typedef std::vector<Agent> AgentVector;

    Simulation(Random& random);
    virtual
    ~Simulation();

    /// \name Lifecycle
    //@{
    /*! Starts a new run
     *
     * Places config.population agents at random in the field,
     * vaccinates each with probability config.vaccinatedFraction,
     * then seeds up to config.initialInfected infections.  Seeding
     * gives up after 5 draws per agent; fewer seeds than requested
     * is not an error (see getSeededInfections()).
     * @throws configuration_error if config is invalid.  On any
     * exception the engine is unchanged.
     */
    void
    init(const Configuration& config);
    /*! Advances the simulation by dt simulated seconds
     *
     * Negative dt is treated as zero.  Does nothing before init().
     */
    void
    step(const simTime_t dt);
    //@}

    /// \name Data access methods
    //@{
    //! Current number of agents per state
    StateCounts
    getSnapshot() const;
    const Timeseries&
    getTimeseries() const;
    const AgentVector&
    getAgents() const;
    const SpatialGrid&
    getGrid() const;
    const Configuration&
    getConfiguration() const;
    simTime_t
    getTime() const;
    //! Number of infections seeded by the last init()
    size_t
    getSeededInfections() const;
    bool
    isInitialised() const;
    //@}

    /// \name Collaborator methods
    //@{
    /*! Replaces the timeseries with externally supplied records
     *
     * Simulated time is set to the last record's t.
     * @throws data_exception if the records are not ordered by t
     */
    void
    importTimeseries(const Timeseries& samples);
    /*! Changes the dynamic parameters of a running simulation
     *
     * Only speed, infection radius, base probability, recovery
     * time, incubation time and asymptomatic fraction are taken
     * from config.  Agents already infected keep the recovery time
     * they were infected with.
     * @throws configuration_error if the result would be invalid
     */
    void
    setParameters(const Configuration& config);
    //! @throws range_exception if id is not in the population
    void
    setSuperSpreader(const agentId_t id, const bool flag);
    /*! Moves agent id to position, heading along velocity
     *
     * Disease state is untouched.  The trail restarts at position.
     * @throws range_exception if id is not in the population
     */
    void
    placeAgent(const agentId_t id, const Point& position,
        const Point& velocity);
    //@}

    /// \name Debug methods
    //@{
    //! Dumps every agent, one per line
    void
    dumpPopulation(std::ostream& os = std::cerr) const;
    //@}

  private:
    Simulation(const Simulation&);
    Simulation&
    operator=(const Simulation&);

    void
    move(const simTime_t dt);
    void
    spread();
    void
    progress(const simTime_t dt);
    void
    sample(const simTime_t dt);
    void
    rebuildGrid();

    Random& random_;
    Configuration config_;
    AgentVector agents_;
    SpatialGrid grid_;
    SpatialGrid::NeighbourList neighbours_;
    TimeseriesRecorder timeseries_;
    simTime_t time_;
    size_t seeded_;
    bool initialised_;
  };

  /*! Per-contact transmission probability
   *
   * Falls linearly from baseProbability at distance 0 to zero at
   * radius, doubled for a super-spreading source and capped at 1.
   */
  double
  transmissionProbability(const double distance, const double radius,
      const double baseProbability, const bool superSpreader = false);

}

#endif /* SIMULATION_HPP_ */
