/*************************************************************************
 *  ./src/sim/Simulation.cpp
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
 * Simulation.cpp
 */

#include <algorithm>
#include <sstream>
#include <utility>
#include <gsl/gsl_math.h>

#include "Simulation.hpp"
#include "EpiSpreadException.hpp"

namespace EpiSpread
{

  Simulation::Simulation(Random& random) :
    random_(random), timeseries_(SAMPLE_INTERVAL), time_(0.0), seeded_(0),
        initialised_(false)
  {
  }

  Simulation::~Simulation()
  {
  }

  void
  Simulation::init(const Configuration& config)
  {
    config.validate();

    // New population is built aside and swapped in when complete
    AgentVector agents;
    agents.reserve(config.population);

    Bounds bounds = config.getBounds();
    double marginX = std::min(SPAWN_MARGIN, bounds.width / 2);
    double marginY = std::min(SPAWN_MARGIN, bounds.height / 2);

    for(size_t i = 0; i < config.population; ++i)
      {
        Point position;
        position.x = random_.uniform(marginX, bounds.width - marginX);
        position.y = random_.uniform(marginY, bounds.height - marginY);

        Point velocity;
        velocity.x = random_.uniform(-1, 1);
        velocity.y = random_.uniform(-1, 1);
        double mag = gsl_hypot(velocity.x, velocity.y);
        if (mag > 0.0) {
            velocity.x /= mag;
            velocity.y /= mag;
        }

        Agent agent(static_cast<agentId_t>(i), position, velocity, config.trailLength);
        if (random_.bernoulli(config.vaccinatedFraction))
          agent.vaccinate();

        agents.push_back(agent);
      }

    // Seed infections by rejection, with a bounded number of draws
    size_t seeded = 0;
    size_t attempts = 0;
    size_t maxAttempts = agents.size() * SEED_ATTEMPTS_PER_AGENT;
    while (seeded < config.initialInfected && attempts < maxAttempts)
      {
        size_t idx = random_.integer(agents.size());
        if (agents[idx].infect(config))
          seeded++;
        attempts++;
      }

    if (seeded < config.initialInfected)
      {
        std::cerr << "Warning: seeded " << seeded << " of "
            << config.initialInfected << " requested infections after "
            << attempts << " attempts" << std::endl;
      }

    for(Configuration::IdList::const_iterator it = config.superSpreaders.begin();
        it != config.superSpreaders.end();
        ++it)
      agents[*it].setSuperSpreader(true);

    SpatialGrid grid;
    grid.rebuild(agents, gridCellSize(config.infectionRadius),
        config.getBounds());

    // Nothing below throws
    Configuration committed(config);
    std::swap(config_, committed);
    agents_.swap(agents);
    grid_.swap(grid);
    seeded_ = seeded;
    time_ = 0.0;
    timeseries_.clear();
    initialised_ = true;

#ifndef NDEBUG
    std::cerr << "Initialised " << agents_.size() << " agents in a "
        << grid_.getCols() << "x" << grid_.getRows() << " grid (cell size "
        << grid_.getCellSize() << ")" << std::endl;
#endif
  }

  void
  Simulation::step(const simTime_t dt)
  {
    if (!initialised_) return;

    simTime_t h = dt > 0.0 ? dt : 0.0;
    time_ += h;

    // Order matters: infection must see post-movement positions
    move(h);
    spread();
    progress(h);
    sample(h);
  }

  void
  Simulation::move(const simTime_t dt)
  {
    Bounds bounds = config_.getBounds();
    for(AgentVector::iterator it = agents_.begin();
        it != agents_.end();
        ++it)
      it->move(dt, config_.speed, bounds, random_);

    rebuildGrid();
  }

  void
  Simulation::spread()
  {
    const double radius = config_.infectionRadius;

    // Agents infected earlier in this sweep act as sources when
    // the sweep reaches them.
    for(AgentVector::iterator source = agents_.begin();
        source != agents_.end();
        ++source)
      {
        if (!source->isInfectious()) continue;

        grid_.queryNeighbours(*source, neighbours_);
        for(SpatialGrid::NeighbourList::const_iterator it = neighbours_.begin();
            it != neighbours_.end();
            ++it)
          {
            Agent& target = agents_[*it];
            if (target.getState() != HEALTHY) continue;

            double distance = source->distanceTo(target);
            if (distance > radius) continue;

            double prob = transmissionProbability(distance, radius,
                config_.baseProbability, source->isSuperSpreader());

            if (random_.bernoulli(prob))
              {
                bool asymptomatic = false;
                if (config_.asymptomaticFraction > 0.0)
                  asymptomatic = random_.bernoulli(config_.asymptomaticFraction);
                target.infect(config_, asymptomatic);
              }
          }
      }
  }

  void
  Simulation::progress(const simTime_t dt)
  {
    for(AgentVector::iterator it = agents_.begin();
        it != agents_.end();
        ++it)
      it->progress(dt);
  }

  void
  Simulation::sample(const simTime_t dt)
  {
    if (!timeseries_.accumulate(dt)) return;

    simTime_t t = roundTime(time_);
    if (!timeseries_.empty())
      t = std::max(t, timeseries_.getSamples().back().t);

    Sample s(t, getSnapshot());
    timeseries_.record(s);
  }

  void
  Simulation::rebuildGrid()
  {
    grid_.rebuild(agents_, gridCellSize(config_.infectionRadius),
        config_.getBounds());
  }

  StateCounts
  Simulation::getSnapshot() const
  {
    StateCounts counts;
    for(AgentVector::const_iterator it = agents_.begin();
        it != agents_.end();
        ++it)
      counts.add(it->getState());
    return counts;
  }

  const Timeseries&
  Simulation::getTimeseries() const
  {
    return timeseries_.getSamples();
  }

  const Simulation::AgentVector&
  Simulation::getAgents() const
  {
    return agents_;
  }

  const SpatialGrid&
  Simulation::getGrid() const
  {
    return grid_;
  }

  const Configuration&
  Simulation::getConfiguration() const
  {
    return config_;
  }

  simTime_t
  Simulation::getTime() const
  {
    return time_;
  }

  size_t
  Simulation::getSeededInfections() const
  {
    return seeded_;
  }

  bool
  Simulation::isInitialised() const
  {
    return initialised_;
  }

  void
  Simulation::importTimeseries(const Timeseries& samples)
  {
    timeseries_.replace(samples);
    time_ = samples.empty() ? 0.0 : samples.back().t;
  }

  void
  Simulation::setParameters(const Configuration& config)
  {
    Configuration updated(config_);
    updated.speed = config.speed;
    updated.infectionRadius = config.infectionRadius;
    updated.baseProbability = config.baseProbability;
    updated.recoveryTime = config.recoveryTime;
    updated.incubationTime = config.incubationTime;
    updated.asymptomaticFraction = config.asymptomaticFraction;
    updated.validate();

    if (initialised_)
      {
        SpatialGrid grid;
        grid.rebuild(agents_, gridCellSize(updated.infectionRadius),
            updated.getBounds());
        grid_.swap(grid);
      }
    std::swap(config_, updated);
  }

  void
  Simulation::placeAgent(const agentId_t id, const Point& position,
      const Point& velocity)
  {
    if (id >= agents_.size())
      {
        std::stringstream msg;
        msg << "agent " << id << " not found in a population of " << agents_.size();
        throw range_exception(msg.str());
      }
    agents_[id].place(position, velocity);
    rebuildGrid();
  }

  void
  Simulation::setSuperSpreader(const agentId_t id, const bool flag)
  {
    if (id >= agents_.size())
      {
        std::stringstream msg;
        msg << "agent " << id << " not found in a population of " << agents_.size();
        throw range_exception(msg.str());
      }
    agents_[id].setSuperSpreader(flag);
  }

  void
  Simulation::dumpPopulation(std::ostream& os) const
  {
    std::streamsize precision = os.precision(6);
    for(AgentVector::const_iterator it = agents_.begin();
        it != agents_.end();
        ++it)
      {
        os << it->getId() << "\t"
            << it->getPosition().x << "\t"
            << it->getPosition().y << "\t"
            << stateName(it->getState()) << "\t"
            << it->getInfectedElapsed()
            << (it->isSuperSpreader() ? "\t*" : "") << "\n";
      }
    os.precision(precision);
    os.flush();
  }

  double
  transmissionProbability(const double distance, const double radius,
      const double baseProbability, const bool superSpreader)
  {
    if (!(radius > 0.0) || distance >= radius) return 0.0;

    double d = distance > 0.0 ? distance : 0.0;
    double prob = baseProbability * (1.0 - d / radius);
    if (superSpreader) prob *= SUPER_SPREADER_MULTIPLIER;
    return std::min(prob, 1.0);
  }

}
