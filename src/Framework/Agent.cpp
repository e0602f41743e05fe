/*************************************************************************
 *  ./src/Framework/Agent.cpp
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

// Defines an agent for the spatial simulation

#include <gsl/gsl_math.h>

#include "Agent.hpp"
#include "Configuration.hpp"

//////////////////////////////////////////////////////
// Agent class
//////////////////////////////////////////////////////

namespace EpiSpread
{

  const char*
  stateName(const DiseaseState_e state)
  {
    switch (state)
      {
    case HEALTHY:
      return "healthy";
    case INFECTED:
      return "infected";
    case ASYMPTOMATIC:
      return "asymptomatic";
    case RECOVERED:
      return "recovered";
    case VACCINATED:
      return "vaccinated";
      }
    return "unknown";
  }

  Agent::Agent(agentId_t id, const Point& position, const Point& velocity,
      size_t trailLength) :
    id_(id), position_(position), velocity_(velocity), state_(HEALTHY),
        infectedElapsed_(0.0), recoveryThreshold_(0.0),
        incubationThreshold_(0.0), superSpreader_(false),
        trailLength_(trailLength)
  {
  }

  bool
  Agent::infect(const Configuration& config, const bool asymptomatic)
  {
    if (state_ != HEALTHY)
      return false;

    state_ = asymptomatic ? ASYMPTOMATIC : INFECTED;
    infectedElapsed_ = 0.0;
    recoveryThreshold_ = config.recoveryTime;
    incubationThreshold_ = config.incubationTime;
    return true;
  }

  bool
  Agent::vaccinate()
  {
    if (state_ != HEALTHY)
      return false;
    state_ = VACCINATED;
    return true;
  }

  void
  Agent::progress(const simTime_t dt)
  {
    if (!isInfectious())
      return;

    infectedElapsed_ += dt;
    if (infectedElapsed_ >= recoveryThreshold_)
      state_ = RECOVERED;
  }

  void
  Agent::move(const simTime_t dt, const double speed, const Bounds& bounds,
      Random& random)
  {
    position_.x += velocity_.x * dt * SPEED_CONSTANT * speed;
    position_.y += velocity_.y * dt * SPEED_CONSTANT * speed;

    // Reflect off the edges
    if (position_.x < 0.0) { position_.x = 0.0; velocity_.x *= -1; }
    if (position_.y < 0.0) { position_.y = 0.0; velocity_.y *= -1; }
    if (position_.x > bounds.width) { position_.x = bounds.width; velocity_.x *= -1; }
    if (position_.y > bounds.height) { position_.y = bounds.height; velocity_.y *= -1; }

    // Random walk component, x drawn before y
    velocity_.x += random.uniform(-VELOCITY_JITTER, VELOCITY_JITTER);
    velocity_.y += random.uniform(-VELOCITY_JITTER, VELOCITY_JITTER);

    double mag = gsl_hypot(velocity_.x, velocity_.y);
    if (mag == 0.0) mag = 1.0;
    velocity_.x /= mag;
    velocity_.y /= mag;

    if (trailLength_ > 0)
      {
        trail_.push_back(position_);
        if (trail_.size() > trailLength_)
          trail_.pop_front();
      }
  }

  void
  Agent::place(const Point& position, const Point& velocity)
  {
    position_ = position;
    velocity_ = velocity;
    trail_.clear();
  }

  double
  Agent::distanceTo(const Agent& other) const
  {
    return gsl_hypot(position_.x - other.position_.x,
        position_.y - other.position_.y);
  }

}
