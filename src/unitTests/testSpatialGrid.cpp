/*************************************************************************
 *  ./src/unitTests/testSpatialGrid.cpp
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
 * testSpatialGrid.cpp
 */

#include <algorithm>
#include <set>
#include <stdexcept>
#include <catch2/catch.hpp>

#include "SpatialGrid.hpp"
#include "Configuration.hpp"
#include "EpiSpreadException.hpp"

using namespace EpiSpread;

namespace
{
  SpatialGrid::AgentVector
  scatter(Random& random, size_t n, const Bounds& bounds)
  {
    SpatialGrid::AgentVector agents;
    for(size_t i=0; i<n; ++i) {
        Point p = {random.uniform(0, bounds.width), random.uniform(0, bounds.height)};
        Point v = {1.0, 0.0};
        agents.push_back(Agent(static_cast<agentId_t>(i), p, v, 0));
    }
    return agents;
  }
}

const char* tag_grid = "[grid]";

TEST_CASE("grid dimensions follow the cell size", tag_grid) {
  Random random(1);
  Bounds bounds = {800.0, 600.0};
  SpatialGrid::AgentVector agents = scatter(random, 10, bounds);

  SpatialGrid grid;
  grid.rebuild(agents, gridCellSize(14.0), bounds);
  REQUIRE(grid.getCellSize() == 28.0);
  REQUIRE(grid.getCols() == 29);
  REQUIRE(grid.getRows() == 22);
  REQUIRE(grid.numAgents() == 10);

  grid.rebuild(agents, gridCellSize(5.0), bounds);
  REQUIRE(grid.getCellSize() == MIN_CELL_SIZE);
  REQUIRE(grid.getCols() == 34);
  REQUIRE(grid.getRows() == 25);
}

TEST_CASE("every agent lands in exactly one cell", tag_grid) {
  Random random(2);
  Bounds bounds = {300.0, 200.0};
  SpatialGrid::AgentVector agents = scatter(random, 200, bounds);

  SpatialGrid grid;
  grid.rebuild(agents, 30.0, bounds);

  size_t total = 0;
  for(size_t c=0; c<grid.getCols()*grid.getRows(); ++c) total += grid[c].size();
  REQUIRE(total == agents.size());

  for(size_t i=0; i<agents.size(); ++i) {
      const SpatialGrid::Cell& cell = grid[grid.cellIndex(agents[i].getPosition())];
      REQUIRE(std::count(cell.begin(), cell.end(), agents[i].getId()) == 1);
  }
}

TEST_CASE("neighbour query finds every contact within the radius", tag_grid) {
  Random random(3);
  Bounds bounds = {400.0, 300.0};
  const double radius = 20.0;
  SpatialGrid::AgentVector agents = scatter(random, 500, bounds);

  SpatialGrid grid;
  grid.rebuild(agents, gridCellSize(radius), bounds);

  SpatialGrid::NeighbourList neighbours;
  for(size_t i=0; i<agents.size(); ++i) {
      grid.queryNeighbours(agents[i], neighbours);
      std::set<agentId_t> found(neighbours.begin(), neighbours.end());

      REQUIRE(found.size() == neighbours.size());
      REQUIRE(found.count(agents[i].getId()) == 0);

      for(size_t j=0; j<agents.size(); ++j) {
          if(i == j) continue;
          if(agents[i].distanceTo(agents[j]) <= radius)
            REQUIRE(found.count(agents[j].getId()) == 1);
      }
  }
}

TEST_CASE("agents on the far edges are clamped into the grid", tag_grid) {
  Bounds bounds = {100.0, 100.0};
  SpatialGrid::AgentVector agents;
  Point v = {1.0, 0.0};
  Point corner = {100.0, 100.0};
  Point near = {95.0, 95.0};
  agents.push_back(Agent(0, corner, v, 0));
  agents.push_back(Agent(1, near, v, 0));

  SpatialGrid grid;
  grid.rebuild(agents, 24.0, bounds);
  REQUIRE(grid.getCols() == 5);
  REQUIRE(grid.cellIndex(corner) == 24);

  SpatialGrid::NeighbourList neighbours = grid.queryNeighbours(agents[0]);
  REQUIRE(neighbours.size() == 1);
  REQUIRE(neighbours[0] == 1);
}

TEST_CASE("a cell larger than the field gives a single cell", tag_grid) {
  Random random(4);
  Bounds bounds = {100.0, 100.0};
  SpatialGrid::AgentVector agents = scatter(random, 10, bounds);

  SpatialGrid grid;
  grid.rebuild(agents, 300.0, bounds);
  REQUIRE(grid.getCols() == 1);
  REQUIRE(grid.getRows() == 1);
  REQUIRE(grid.queryNeighbours(agents[3]).size() == 9);
}

TEST_CASE("rebuild rejects bad input", tag_grid) {
  Bounds bounds = {100.0, 100.0};
  SpatialGrid::AgentVector agents;
  Point p = {50.0, 50.0};
  Point v = {1.0, 0.0};
  agents.push_back(Agent(7, p, v, 0));

  SpatialGrid grid;
  CHECK_THROWS_AS(grid[0], range_exception);
  CHECK_THROWS_AS(grid.cellIndex(p), range_exception);
  CHECK_THROWS_AS(grid.rebuild(agents, 0.0, bounds), std::invalid_argument);
  CHECK_THROWS_AS(grid.rebuild(agents, 24.0, bounds), std::invalid_argument);
}

TEST_CASE("cell access is range checked", tag_grid) {
  Random random(5);
  Bounds bounds = {100.0, 100.0};
  SpatialGrid::AgentVector agents = scatter(random, 5, bounds);

  SpatialGrid grid;
  grid.rebuild(agents, 50.0, bounds);
  CHECK_NOTHROW(grid[3]);
  CHECK_THROWS_AS(grid[4], range_exception);
}

TEST_CASE("grids too large to address are refused", tag_grid) {
  SpatialGrid::AgentVector agents;
  Point p = {10.0, 10.0};
  Point v = {1.0, 0.0};
  agents.push_back(Agent(0, p, v, 0));

  Bounds wraps = {28.0 * 274177.0, 28.0 * 67280421310721.0};
  Bounds huge = {1e300, 1e300};

  SpatialGrid grid;
  CHECK_THROWS_AS(grid.rebuild(agents, 28.0, wraps), range_exception);
  CHECK_THROWS_AS(grid.rebuild(agents, 28.0, huge), range_exception);
  REQUIRE(grid.getCols() == 0);
  REQUIRE(grid.numAgents() == 0);
}

TEST_CASE("a rejected rebuild leaves the grid as it was", tag_grid) {
  Random random(6);
  Bounds bounds = {100.0, 100.0};
  SpatialGrid::AgentVector agents = scatter(random, 5, bounds);

  SpatialGrid grid;
  grid.rebuild(agents, 50.0, bounds);

  SpatialGrid::AgentVector misnumbered = agents;
  Point p = {1.0, 1.0};
  Point v = {1.0, 0.0};
  misnumbered.push_back(Agent(9, p, v, 0));
  CHECK_THROWS_AS(grid.rebuild(misnumbered, 24.0, bounds), std::invalid_argument);

  REQUIRE(grid.getCellSize() == 50.0);
  REQUIRE(grid.getCols() == 2);
  REQUIRE(grid.numAgents() == 5);
  size_t total = 0;
  for(size_t c=0; c<4; ++c) total += grid[c].size();
  REQUIRE(total == 5);
}

TEST_CASE("swap exchanges whole grids", tag_grid) {
  Random random(7);
  Bounds bounds = {100.0, 100.0};
  SpatialGrid::AgentVector agents = scatter(random, 5, bounds);

  SpatialGrid a;
  SpatialGrid b;
  a.rebuild(agents, 50.0, bounds);
  a.swap(b);
  REQUIRE(a.getCols() == 0);
  REQUIRE(b.getCols() == 2);
  REQUIRE(b.numAgents() == 5);
}
