/*************************************************************************
 *  ./src/Framework/Agent.hpp
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

#ifndef AGENT_HPP
#define AGENT_HPP

#include <deque>

#include "types.hpp"
#include "Random.hpp"

namespace EpiSpread
{

  struct Configuration;

  /////////////////////////////////
  // ENUMS
  /////////////////////////////////

  enum DiseaseState_e
  {
    HEALTHY = 0, INFECTED, ASYMPTOMATIC, RECOVERED, VACCINATED
  };

  const size_t NUM_DISEASE_STATES = 5;

  //! Lower-case name of a state, as used in exported records
  const char*
  stateName(const DiseaseState_e state);


  /*! \brief A moving individual
   *
   * State transitions are one-way:
   * HEALTHY -> {INFECTED, ASYMPTOMATIC} -> RECOVERED, and
   * HEALTHY -> VACCINATED.  RECOVERED and VACCINATED are sinks.
   */
  class Agent
  {
  public:
    typedef std::deque<Point> Trail;

  private:
    agentId_t id_;
    Point position_;
    Point velocity_;
    DiseaseState_e state_;
    simTime_t infectedElapsed_;
    simTime_t recoveryThreshold_;
    simTime_t incubationThreshold_;
    bool superSpreader_;
    Trail trail_;
    size_t trailLength_;

  public:

    Agent(agentId_t id, const Point& position, const Point& velocity,
        size_t trailLength);

    virtual
    ~Agent()
    {
    }

    // Data methods
    agentId_t
    getId() const
    {
      return id_;
    }

    const Point&
    getPosition() const
    {
      return position_;
    }

    const Point&
    getVelocity() const
    {
      return velocity_;
    }

    DiseaseState_e
    getState() const
    {
      return state_;
    }

    simTime_t
    getInfectedElapsed() const
    {
      return infectedElapsed_;
    }

    simTime_t
    getRecoveryThreshold() const
    {
      return recoveryThreshold_;
    }

    simTime_t
    getIncubationThreshold() const
    {
      return incubationThreshold_;
    }

    bool
    isSuperSpreader() const
    {
      return superSpreader_;
    }

    void
    setSuperSpreader(const bool flag)
    {
      superSpreader_ = flag;
    }

    const Trail&
    getTrail() const
    {
      return trail_;
    }

    bool
    isInfectious() const
    {
      return state_ == INFECTED || state_ == ASYMPTOMATIC;
    }

    bool
    isTerminal() const
    {
      return state_ == RECOVERED || state_ == VACCINATED;
    }

    // State transitions

    /*! Infects a healthy agent
     *
     * Captures the recovery and incubation times of config so
     * that later parameter changes leave this infection alone.
     * @return true if the agent was HEALTHY and is now infected
     */
    bool
    infect(const Configuration& config, const bool asymptomatic = false);

    //! Marks a healthy agent as vaccinated.  Returns false otherwise.
    bool
    vaccinate();

    /*! Advances the infection clock by dt, recovering at threshold.
     * No-op unless the agent is infectious.
     */
    void
    progress(const simTime_t dt);

    /*! Moves the agent, reflecting off the field edges
     *
     * @param dt simulated seconds
     * @param speed speed multiplier
     * @param bounds the simulation field
     * @param random source of the velocity perturbation
     */
    void
    move(const simTime_t dt, const double speed, const Bounds& bounds,
        Random& random);

    //! Euclidean distance to another agent
    //! Sets position and velocity directly, restarting the trail
    void
    place(const Point& position, const Point& velocity);

    double
    distanceTo(const Agent& other) const;
  };

}

#endif
