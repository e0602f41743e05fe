/*************************************************************************
 *  ./src/unitTests/testSimulation.cpp
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
 * testSimulation.cpp
 */

#include <algorithm>
#include <cmath>
#include <sstream>
#include <catch2/catch.hpp>

#include "Simulation.hpp"

using namespace EpiSpread;

namespace
{
  Configuration
  smallWorld()
  {
    Configuration config;
    config.population = 60;
    config.initialInfected = 3;
    config.fieldWidth = 200.0;
    config.fieldHeight = 150.0;
    config.infectionRadius = 15.0;
    config.baseProbability = 0.6;
    config.recoveryTime = 3.0;
    return config;
  }

  bool
  sameAgents(const Simulation::AgentVector& a, const Simulation::AgentVector& b)
  {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i)
      {
        if (a[i].getPosition().x != b[i].getPosition().x) return false;
        if (a[i].getPosition().y != b[i].getPosition().y) return false;
        if (a[i].getState() != b[i].getState()) return false;
      }
    return true;
  }
}

const char* tag_sim = "[simulation]";

TEST_CASE("transmission probability falls off with distance", tag_sim) {
  const double r = 14.0;
  const double p = 0.45;

  REQUIRE(transmissionProbability(0.0, r, p) == Approx(p));
  REQUIRE(transmissionProbability(7.0, r, p) == Approx(p / 2));
  REQUIRE(transmissionProbability(r, r, p) == 0.0);
  REQUIRE(transmissionProbability(r + 1, r, p) == 0.0);
  REQUIRE(transmissionProbability(1.0, 0.0, p) == 0.0);

  double last = p;
  for (double d = 0.0; d < r; d += 0.25)
    {
      double prob = transmissionProbability(d, r, p);
      REQUIRE(prob >= 0.0);
      REQUIRE(prob <= p);
      REQUIRE(prob <= last);
      last = prob;
    }
}

TEST_CASE("super-spreaders double transmission up to certainty", tag_sim) {
  REQUIRE(transmissionProbability(7.0, 14.0, 0.4, true) == Approx(0.4));
  REQUIRE(transmissionProbability(0.0, 14.0, 0.8, true) == 1.0);
  REQUIRE(transmissionProbability(14.0, 14.0, 0.8, true) == 0.0);
}

TEST_CASE("init builds the population", tag_sim) {
  Random random(1);
  Simulation sim(random);
  REQUIRE_FALSE(sim.isInitialised());

  Configuration config = smallWorld();
  sim.init(config);

  REQUIRE(sim.isInitialised());
  REQUIRE(sim.getAgents().size() == 60);
  REQUIRE(sim.getTime() == 0.0);
  REQUIRE(sim.getTimeseries().empty());
  REQUIRE(sim.getSeededInfections() == 3);

  StateCounts counts = sim.getSnapshot();
  REQUIRE(counts.total() == 60);
  REQUIRE(counts.infected == 3);
  REQUIRE(counts.healthy == 57);

  for (size_t i = 0; i < sim.getAgents().size(); ++i)
    {
      const Agent& agent = sim.getAgents()[i];
      REQUIRE(agent.getId() == i);
      REQUIRE(agent.getPosition().x >= 10.0);
      REQUIRE(agent.getPosition().x <= 190.0);
      REQUIRE(agent.getPosition().y >= 10.0);
      REQUIRE(agent.getPosition().y <= 140.0);
    }

  REQUIRE(sim.getGrid().getCellSize() == 30.0);
  REQUIRE(sim.getGrid().numAgents() == 60);
}

TEST_CASE("invalid configurations are rejected", tag_sim) {
  Random random(1);
  Simulation sim(random);

  Configuration empty;
  empty.population = 0;
  CHECK_THROWS_AS(sim.init(empty), configuration_error);

  Configuration pointContact;
  pointContact.infectionRadius = 0.0;
  CHECK_THROWS_AS(sim.init(pointContact), configuration_error);

  REQUIRE_FALSE(sim.isInitialised());
}

TEST_CASE("a failed init leaves the running simulation alone", tag_sim) {
  Random random(2);
  Simulation sim(random);
  sim.init(smallWorld());
  for (int i = 0; i < 20; ++i) sim.step(0.1);

  StateCounts before = sim.getSnapshot();
  simTime_t time = sim.getTime();
  size_t samples = sim.getTimeseries().size();
  Point first = sim.getAgents()[0].getPosition();
  double cellSize = sim.getGrid().getCellSize();

  Configuration bad = smallWorld();
  SECTION("empty population") {
    bad.population = 0;
  }
  SECTION("field whose grid cell count wraps") {
    bad.population = 50;
    bad.infectionRadius = 14.0;
    bad.fieldWidth = 28.0 * 8589934592.0;
    bad.fieldHeight = 28.0 * 2147483648.0;
  }
  SECTION("field whose grid is too large to allocate") {
    bad.population = 50;
    bad.fieldWidth = 1e6;
    bad.fieldHeight = 1e6;
  }
  CHECK_THROWS_AS(sim.init(bad), configuration_error);

  REQUIRE(sim.isInitialised());
  REQUIRE(sim.getSnapshot() == before);
  REQUIRE(sim.getTime() == time);
  REQUIRE(sim.getTimeseries().size() == samples);
  REQUIRE(sim.getAgents().size() == 60);
  REQUIRE(sim.getAgents()[0].getPosition().x == first.x);
  REQUIRE(sim.getAgents()[0].getPosition().y == first.y);
  REQUIRE(sim.getConfiguration().population == 60);
  REQUIRE(sim.getConfiguration().fieldWidth == 200.0);
  REQUIRE(sim.getGrid().getCellSize() == cellSize);
  REQUIRE(sim.getGrid().numAgents() == 60);

  // Still runs afterwards
  sim.step(0.1);
  REQUIRE(sim.getSnapshot().total() == 60);
}

TEST_CASE("step before init does nothing", tag_sim) {
  Random random(3);
  Simulation sim(random);
  sim.step(0.1);
  REQUIRE(sim.getTime() == 0.0);
  REQUIRE(sim.getTimeseries().empty());
}

TEST_CASE("seeding stops when no healthy agent remains", tag_sim) {
  Random random(4);
  Simulation sim(random);

  Configuration config = smallWorld();
  config.vaccinatedFraction = 1.0;
  sim.init(config);
  REQUIRE(sim.getSeededInfections() == 0);
  REQUIRE(sim.getSnapshot().vaccinated == 60);

  config.vaccinatedFraction = 0.0;
  config.population = 5;
  config.initialInfected = 10;
  sim.init(config);
  REQUIRE(sim.getSeededInfections() <= 5);
  REQUIRE(sim.getSnapshot().infected == sim.getSeededInfections());
}

TEST_CASE("population is conserved and terminal states are kept", tag_sim) {
  Random random(5);
  Simulation sim(random);
  Configuration config = smallWorld();
  config.vaccinatedFraction = 0.2;
  config.asymptomaticFraction = 0.3;
  sim.init(config);

  std::vector<DiseaseState_e> previous;
  for (size_t i = 0; i < sim.getAgents().size(); ++i)
    previous.push_back(sim.getAgents()[i].getState());

  for (int step = 0; step < 300; ++step)
    {
      sim.step(0.05);
      REQUIRE(sim.getSnapshot().total() == 60);

      for (size_t i = 0; i < sim.getAgents().size(); ++i)
        {
          DiseaseState_e state = sim.getAgents()[i].getState();
          if (previous[i] == RECOVERED || previous[i] == VACCINATED)
            REQUIRE(state == previous[i]);
          previous[i] = state;
        }
    }
}

TEST_CASE("samples are ordered and half a second apart", tag_sim) {
  Random random(6);
  Simulation sim(random);
  sim.init(smallWorld());

  const double dt = 1.0 / 60.0;
  for (int i = 0; i < 600; ++i) sim.step(dt);

  const Timeseries& ts = sim.getTimeseries();
  REQUIRE(ts.size() >= 19);
  REQUIRE(ts[0].t == Approx(0.5).margin(dt));
  for (size_t i = 1; i < ts.size(); ++i)
    {
      REQUIRE(ts[i].t >= ts[i-1].t);
      REQUIRE(ts[i].t - ts[i-1].t >= 0.5 - 0.002);
      REQUIRE(ts[i].t - ts[i-1].t <= 0.5 + dt + 0.002);
      REQUIRE(ts[i].healthy + ts[i].infected + ts[i].asymptomatic
              + ts[i].recovered + ts[i].vaccinated == 60.0);
    }
}

TEST_CASE("a fixed seed reproduces the run", tag_sim) {
  Random randomA(99);
  Random randomB(99);
  Simulation a(randomA);
  Simulation b(randomB);

  a.init(smallWorld());
  b.init(smallWorld());
  REQUIRE(sameAgents(a.getAgents(), b.getAgents()));

  for (int i = 0; i < 200; ++i)
    {
      a.step(0.1);
      b.step(0.1);
    }
  REQUIRE(sameAgents(a.getAgents(), b.getAgents()));
  REQUIRE(a.getTimeseries() == b.getTimeseries());
}

TEST_CASE("negative steps do not move time backwards", tag_sim) {
  Random random(7);
  Simulation sim(random);
  sim.init(smallWorld());
  sim.step(0.1);
  sim.step(-1.0);
  REQUIRE(sim.getTime() == Approx(0.1));
}

TEST_CASE("a crowded field ends with everyone recovered", tag_sim) {
  Random random(2012);
  Simulation sim(random);

  Configuration config;
  config.population = 10;
  config.initialInfected = 1;
  config.vaccinatedFraction = 0.0;
  config.baseProbability = 1.0;
  config.fieldWidth = 100.0;
  config.fieldHeight = 100.0;
  config.infectionRadius = std::sqrt(100.0 * 100.0 + 100.0 * 100.0);
  config.recoveryTime = 5.0;
  // Stationary agents stay inside the spawn margin, keeping every
  // pair well inside the radius
  config.speed = 0.0;
  sim.init(config);

  REQUIRE(sim.getGrid().getCols() == 1);
  REQUIRE(sim.getGrid().getRows() == 1);

  for (int i = 0; i < 100; ++i) sim.step(0.1);

  StateCounts counts = sim.getSnapshot();
  REQUIRE(counts.healthy == 0);
  REQUIRE(counts.infected == 0);
  REQUIRE(counts.asymptomatic == 0);
  REQUIRE(counts.recovered == 10);
}

TEST_CASE("the default field ends with everyone recovered", tag_sim) {
  Random random(2012);
  Simulation sim(random);

  Configuration config;
  config.population = 10;
  config.initialInfected = 1;
  config.vaccinatedFraction = 0.0;
  config.baseProbability = 1.0;
  config.infectionRadius = std::sqrt(800.0 * 800.0 + 600.0 * 600.0);
  config.recoveryTime = 5.0;
  sim.init(config);

  for (int i = 0; i < 100; ++i) sim.step(0.1);

  StateCounts counts = sim.getSnapshot();
  REQUIRE(counts.healthy == 0);
  REQUIRE(counts.infected == 0);
  REQUIRE(counts.asymptomatic == 0);
  REQUIRE(counts.recovered == 10);
}

TEST_CASE("infection sees positions after this step's movement", tag_sim) {
  Random random(13);
  Simulation sim(random);

  Configuration config;
  config.population = 2;
  config.initialInfected = 1;
  config.baseProbability = 1.0;
  config.infectionRadius = 14.0;
  config.speed = 2.0;
  sim.init(config);
  REQUIRE(sim.getSeededInfections() == 1);

  agentId_t source = sim.getAgents()[0].getState() == INFECTED ? 0 : 1;
  agentId_t target = 1 - source;
  sim.setSuperSpreader(source, true);

  // 0.1 s at speed 2 covers 10 units, so each agent closes half the gap
  Point sourceAt = {100.0, 300.0};
  Point targetAt = {120.0, 300.0};
  Point east = {1.0, 0.0};
  Point west = {-1.0, 0.0};

  SECTION("approaching agents meet within the radius") {
    sim.placeAgent(source, sourceAt, east);
    sim.placeAgent(target, targetAt, west);
    REQUIRE(sim.getAgents()[source].distanceTo(sim.getAgents()[target]) > 14.0);

    sim.step(0.1);
    REQUIRE(sim.getAgents()[source].distanceTo(sim.getAgents()[target]) < 1e-9);
    REQUIRE(sim.getAgents()[target].getState() == INFECTED);
  }
  SECTION("separating agents leave the radius first") {
    Point together = {110.0, 300.0};
    sim.placeAgent(source, together, west);
    sim.placeAgent(target, together, east);

    sim.step(0.1);
    REQUIRE(sim.getAgents()[source].distanceTo(sim.getAgents()[target]) > 14.0);
    REQUIRE(sim.getAgents()[target].getState() == HEALTHY);
  }
}

TEST_CASE("placing an agent moves it and reindexes the grid", tag_sim) {
  Random random(14);
  Simulation sim(random);
  sim.init(smallWorld());

  Point corner = {1.0, 1.0};
  Point north = {0.0, -1.0};
  sim.placeAgent(7, corner, north);
  REQUIRE(sim.getAgents()[7].getPosition().x == 1.0);
  REQUIRE(sim.getAgents()[7].getVelocity().y == -1.0);
  REQUIRE(sim.getAgents()[7].getTrail().empty());

  const SpatialGrid::Cell& cell = sim.getGrid()[0];
  REQUIRE(std::count(cell.begin(), cell.end(), 7u) == 1);

  CHECK_THROWS_AS(sim.placeAgent(60, corner, north), range_exception);
}

TEST_CASE("imported records replace the timeseries", tag_sim) {
  Random random(8);
  Simulation sim(random);

  Timeseries records;
  Sample first;
  first.t = 0;
  first.healthy = 95;
  first.infected = 5;
  Sample second;
  second.t = 1;
  second.healthy = 90;
  second.infected = 10;
  records.push_back(first);
  records.push_back(second);

  sim.importTimeseries(records);
  REQUIRE(sim.getTimeseries().size() == 2);
  REQUIRE(sim.getTimeseries()[0] == first);
  REQUIRE(sim.getTimeseries()[1] == second);
  REQUIRE(sim.getTime() == 1.0);

  Timeseries backwards;
  backwards.push_back(second);
  backwards.push_back(first);
  CHECK_THROWS_AS(sim.importTimeseries(backwards), data_exception);
  REQUIRE(sim.getTimeseries().size() == 2);
}

TEST_CASE("parameters can change mid-run", tag_sim) {
  Random random(9);
  Simulation sim(random);
  sim.init(smallWorld());
  sim.step(0.1);

  Configuration changed = smallWorld();
  changed.infectionRadius = 40.0;
  changed.population = 5;
  sim.setParameters(changed);

  REQUIRE(sim.getConfiguration().infectionRadius == 40.0);
  REQUIRE(sim.getConfiguration().population == 60);
  REQUIRE(sim.getGrid().getCellSize() == 80.0);

  changed.baseProbability = 2.0;
  CHECK_THROWS_AS(sim.setParameters(changed), configuration_error);
  REQUIRE(sim.getConfiguration().baseProbability == 0.6);
  REQUIRE(sim.getGrid().getCellSize() == 80.0);
}

TEST_CASE("a radius change that needs too many cells is refused", tag_sim) {
  Random random(12);
  Simulation sim(random);
  Configuration config = smallWorld();
  config.fieldWidth = 50000.0;
  config.fieldHeight = 50000.0;
  config.infectionRadius = 100.0;
  sim.init(config);
  REQUIRE(sim.getGrid().getCols() == 250);

  Configuration changed = config;
  changed.infectionRadius = 1.0;
  CHECK_THROWS_AS(sim.setParameters(changed), configuration_error);
  REQUIRE(sim.getConfiguration().infectionRadius == 100.0);
  REQUIRE(sim.getGrid().getCellSize() == 200.0);
  REQUIRE(sim.getGrid().getCols() == 250);
}

TEST_CASE("super-spreaders are flagged by id", tag_sim) {
  Random random(10);
  Simulation sim(random);

  Configuration config = smallWorld();
  config.superSpreaders.push_back(4);
  sim.init(config);
  REQUIRE(sim.getAgents()[4].isSuperSpreader());
  REQUIRE_FALSE(sim.getAgents()[5].isSuperSpreader());

  sim.setSuperSpreader(5, true);
  sim.setSuperSpreader(4, false);
  REQUIRE(sim.getAgents()[5].isSuperSpreader());
  REQUIRE_FALSE(sim.getAgents()[4].isSuperSpreader());

  CHECK_THROWS_AS(sim.setSuperSpreader(60, true), range_exception);
}

TEST_CASE("population dump lists every agent", tag_sim) {
  Random random(11);
  Simulation sim(random);
  sim.init(smallWorld());

  std::stringstream out;
  out.precision(12);
  sim.dumpPopulation(out);
  REQUIRE(out.precision() == 12);

  std::string line;
  size_t lines = 0;
  while (std::getline(out, line)) lines++;
  REQUIRE(lines == 60);
}
