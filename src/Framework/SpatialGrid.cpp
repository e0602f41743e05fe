/*************************************************************************
 *  ./src/Framework/SpatialGrid.cpp
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
 * SpatialGrid.cpp
 */

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "SpatialGrid.hpp"
#include "Configuration.hpp"
#include "EpiSpreadException.hpp"

namespace EpiSpread
{

  namespace
  {
    size_t
    clampCell(const double c, const size_t n)
    {
      // c is floor(position / cellSize); positions may sit outside
      // the field by rounding, so clamp both ways.
      if (!(c > 0.0)) return 0;
      if (c >= static_cast<double>(n - 1)) return n - 1;
      return static_cast<size_t>(c);
    }
  }

  SpatialGrid::SpatialGrid() :
    cellSize_(MIN_CELL_SIZE), cols_(0), rows_(0), numAgents_(0)
  {
  }

  SpatialGrid::~SpatialGrid()
  {
  }

  void
  SpatialGrid::rebuild(const AgentVector& agents, const double cellSize,
      const Bounds& bounds)
  {
    if (!(cellSize > 0.0))
      throw std::invalid_argument("SpatialGrid cell size must be positive");

    for(AgentVector::const_iterator it = agents.begin();
        it != agents.end();
        ++it)
      {
        if (it->getId() != static_cast<agentId_t>(it - agents.begin()))
          throw std::invalid_argument("SpatialGrid requires agent i to have id i");
      }

    double colsD = std::max(1.0, std::ceil(bounds.width / cellSize));
    double rowsD = std::max(1.0, std::ceil(bounds.height / cellSize));
    const double maxCells = static_cast<double>(std::numeric_limits<size_t>::max());
    if (!(colsD < maxCells) || !(rowsD < maxCells))
      throw range_exception("grid dimensions exceed the addressable size");

    size_t cols = static_cast<size_t>(colsD);
    size_t rows = static_cast<size_t>(rowsD);
    if (cols > std::numeric_limits<size_t>::max() / rows)
      throw range_exception("grid cell count overflows");

    // Keep the bucket storage between rebuilds; only the contents change
    cells_.resize(cols * rows);
    for(std::vector<Cell>::iterator it = cells_.begin();
        it != cells_.end();
        ++it)
      it->clear();

    cellSize_ = cellSize;
    cols_ = cols;
    rows_ = rows;

    for(AgentVector::const_iterator it = agents.begin();
        it != agents.end();
        ++it)
      cells_[cellIndex(it->getPosition())].push_back(it->getId());

    numAgents_ = agents.size();
  }

  void
  SpatialGrid::swap(SpatialGrid& other)
  {
    cells_.swap(other.cells_);
    std::swap(cellSize_, other.cellSize_);
    std::swap(cols_, other.cols_);
    std::swap(rows_, other.rows_);
    std::swap(numAgents_, other.numAgents_);
  }

  void
  SpatialGrid::queryNeighbours(const Agent& agent, NeighbourList& neighbours) const
  {
    neighbours.clear();
    if (cells_.empty()) return;

    size_t cx, cy;
    cellCoords(agent.getPosition(), cx, cy);

    size_t xlo = cx > 0 ? cx - 1 : 0;
    size_t xhi = cx + 1 < cols_ ? cx + 1 : cols_ - 1;
    size_t ylo = cy > 0 ? cy - 1 : 0;
    size_t yhi = cy + 1 < rows_ ? cy + 1 : rows_ - 1;

    for(size_t nx = xlo; nx <= xhi; ++nx)
      {
        for(size_t ny = ylo; ny <= yhi; ++ny)
          {
            const Cell& cell = cells_[nx + ny * cols_];
            for(Cell::const_iterator it = cell.begin();
                it != cell.end();
                ++it)
              {
                if (*it != agent.getId()) neighbours.push_back(*it);
              }
          }
      }
  }

  SpatialGrid::NeighbourList
  SpatialGrid::queryNeighbours(const Agent& agent) const
  {
    NeighbourList neighbours;
    queryNeighbours(agent, neighbours);
    return neighbours;
  }

  void
  SpatialGrid::cellCoords(const Point& p, size_t& cx, size_t& cy) const
  {
    cx = clampCell(std::floor(p.x / cellSize_), cols_);
    cy = clampCell(std::floor(p.y / cellSize_), rows_);
  }

  size_t
  SpatialGrid::cellIndex(const Point& p) const
  {
    if (cells_.empty())
      throw range_exception("cellIndex called on an empty grid");
    size_t cx, cy;
    cellCoords(p, cx, cy);
    return cx + cy * cols_;
  }

  const SpatialGrid::Cell&
  SpatialGrid::operator[](const size_t cell) const
  {
    if (cell >= cells_.size())
      throw range_exception("grid cell index out of range");
    return cells_[cell];
  }

  double
  SpatialGrid::getCellSize() const
  {
    return cellSize_;
  }

  size_t
  SpatialGrid::getCols() const
  {
    return cols_;
  }

  size_t
  SpatialGrid::getRows() const
  {
    return rows_;
  }

  size_t
  SpatialGrid::numAgents() const
  {
    return numAgents_;
  }

}
