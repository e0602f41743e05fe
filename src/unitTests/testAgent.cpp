/*************************************************************************
 *  ./src/unitTests/testAgent.cpp
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
 * testAgent.cpp
 */

#include <cmath>
#include <string>
#include <catch2/catch.hpp>

#include "Agent.hpp"
#include "Configuration.hpp"

using namespace EpiSpread;

namespace
{
  Agent
  makeAgent(double x, double y, double vx = 1.0, double vy = 0.0)
  {
    Point p = {x, y};
    Point v = {vx, vy};
    return Agent(0, p, v, DEFAULT_TRAIL_LENGTH);
  }
}

const char* tag_agent = "[agent]";

TEST_CASE("a new agent is healthy", tag_agent) {
  Agent agent = makeAgent(10, 20);
  REQUIRE(agent.getState() == HEALTHY);
  REQUIRE_FALSE(agent.isInfectious());
  REQUIRE_FALSE(agent.isTerminal());
  REQUIRE_FALSE(agent.isSuperSpreader());
  REQUIRE(agent.getInfectedElapsed() == 0.0);
  REQUIRE(agent.getTrail().empty());
}

TEST_CASE("infection captures the recovery time", tag_agent) {
  Configuration config;
  config.recoveryTime = 3.0;
  config.incubationTime = 1.0;

  Agent agent = makeAgent(10, 20);
  REQUIRE(agent.infect(config));
  REQUIRE(agent.getState() == INFECTED);
  REQUIRE(agent.getRecoveryThreshold() == 3.0);
  REQUIRE(agent.getIncubationThreshold() == 1.0);

  // Later parameter changes do not affect an existing infection
  config.recoveryTime = 100.0;
  REQUIRE_FALSE(agent.infect(config));
  REQUIRE(agent.getRecoveryThreshold() == 3.0);
}

TEST_CASE("asymptomatic infections are infectious", tag_agent) {
  Configuration config;
  Agent agent = makeAgent(10, 20);
  REQUIRE(agent.infect(config, true));
  REQUIRE(agent.getState() == ASYMPTOMATIC);
  REQUIRE(agent.isInfectious());
}

TEST_CASE("infected agents recover at the threshold", tag_agent) {
  Configuration config;
  config.recoveryTime = 1.0;

  Agent agent = makeAgent(10, 20);
  agent.infect(config);

  agent.progress(0.5);
  REQUIRE(agent.getState() == INFECTED);
  REQUIRE(agent.getInfectedElapsed() == Approx(0.5));

  agent.progress(0.5);
  REQUIRE(agent.getState() == RECOVERED);
  REQUIRE(agent.isTerminal());
}

TEST_CASE("progress does not touch uninfected agents", tag_agent) {
  Agent agent = makeAgent(10, 20);
  agent.progress(100.0);
  REQUIRE(agent.getState() == HEALTHY);
  REQUIRE(agent.getInfectedElapsed() == 0.0);
}

TEST_CASE("terminal states are absorbing", tag_agent) {
  Configuration config;

  Agent vaccinated = makeAgent(10, 20);
  REQUIRE(vaccinated.vaccinate());
  REQUIRE(vaccinated.getState() == VACCINATED);
  REQUIRE_FALSE(vaccinated.infect(config));
  REQUIRE_FALSE(vaccinated.vaccinate());
  vaccinated.progress(100.0);
  REQUIRE(vaccinated.getState() == VACCINATED);

  config.recoveryTime = 0.1;
  Agent recovered = makeAgent(10, 20);
  recovered.infect(config);
  recovered.progress(0.2);
  REQUIRE(recovered.getState() == RECOVERED);
  REQUIRE_FALSE(recovered.infect(config));
  REQUIRE_FALSE(recovered.vaccinate());
  REQUIRE(recovered.getState() == RECOVERED);
}

TEST_CASE("movement keeps agents in the field with unit velocity", tag_agent) {
  Random random(5);
  Bounds bounds = {100.0, 50.0};
  Agent agent = makeAgent(95, 45, 1.0, 0.0);

  for(int i=0; i<1000; ++i) {
      agent.move(0.1, 2.0, bounds, random);
      const Point& p = agent.getPosition();
      REQUIRE(p.x >= 0.0);
      REQUIRE(p.x <= bounds.width);
      REQUIRE(p.y >= 0.0);
      REQUIRE(p.y <= bounds.height);

      const Point& v = agent.getVelocity();
      REQUIRE(std::sqrt(v.x*v.x + v.y*v.y) == Approx(1.0));
  }
}

TEST_CASE("crossing an edge clamps and reflects", tag_agent) {
  Random random(5);
  Bounds bounds = {100.0, 100.0};
  Agent agent = makeAgent(99, 50, 1.0, 0.0);

  // 50 units per second at unit speed
  agent.move(1.0, 1.0, bounds, random);
  REQUIRE(agent.getPosition().x == 100.0);
  REQUIRE(agent.getPosition().y == 50.0);
  REQUIRE(agent.getVelocity().x < 0.0);
}

TEST_CASE("zero speed leaves position unchanged", tag_agent) {
  Random random(9);
  Bounds bounds = {100.0, 100.0};
  Agent agent = makeAgent(30, 40, 0.6, 0.8);

  agent.move(0.1, 0.0, bounds, random);
  REQUIRE(agent.getPosition().x == 30.0);
  REQUIRE(agent.getPosition().y == 40.0);
}

TEST_CASE("trail keeps the most recent positions", tag_agent) {
  Random random(1);
  Bounds bounds = {800.0, 600.0};
  Agent agent = makeAgent(400, 300);

  for(int i=0; i<20; ++i) agent.move(0.01, 1.0, bounds, random);

  REQUIRE(agent.getTrail().size() == DEFAULT_TRAIL_LENGTH);
  REQUIRE(agent.getTrail().back().x == agent.getPosition().x);
  REQUIRE(agent.getTrail().back().y == agent.getPosition().y);
}

TEST_CASE("distance is Euclidean", tag_agent) {
  Agent a = makeAgent(0, 0);
  Agent b = makeAgent(3, 4);
  REQUIRE(a.distanceTo(b) == Approx(5.0));
  REQUIRE(b.distanceTo(a) == Approx(5.0));
}

TEST_CASE("state names", tag_agent) {
  REQUIRE(std::string(stateName(HEALTHY)) == "healthy");
  REQUIRE(std::string(stateName(ASYMPTOMATIC)) == "asymptomatic");
  REQUIRE(std::string(stateName(VACCINATED)) == "vaccinated");
}
