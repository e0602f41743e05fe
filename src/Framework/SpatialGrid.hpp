/*************************************************************************
 *  ./src/Framework/SpatialGrid.hpp
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
 * SpatialGrid.hpp
 *
 *  Uniform bucket index over agent positions.
 */

#ifndef SPATIALGRID_HPP_
#define SPATIALGRID_HPP_

#include <vector>

#include "types.hpp"
#include "Agent.hpp"

namespace EpiSpread
{

  /*! \brief Uniform grid of agent buckets
   *
   * The grid is rebuilt from scratch from the current agent
   * positions.  Provided the cell size is at least the contact
   * radius, any two agents within the radius of one another lie in
   * the same or adjacent cells, so a 3x3 block query returns a
   * superset of the true contacts.
   *
   * Buckets hold agent ids, which are positions in the agent
   * vector passed to rebuild().
   */
  class SpatialGrid
  {
  public:
    typedef std::vector<agentId_t> Cell;
    typedef std::vector<agentId_t> NeighbourList;
    typedef std::vector<Agent> AgentVector;

    SpatialGrid();
    virtual
    ~SpatialGrid();

    /*! Buckets every agent by its clamped cell coordinates.  O(n).
     *
     * @param agents the population; agent i must have id i
     * @param cellSize side of a square cell, > 0
     * @param bounds the simulation field
     * @throws range_exception if the cell count is not addressable
     */
    void
    rebuild(const AgentVector& agents, const double cellSize,
        const Bounds& bounds);

    /*! Collects the agents in the 3x3 cell block around agent
     *
     * @param agent the querying agent, which is never returned
     * @param neighbours cleared, then filled with neighbour ids
     */
    void
    queryNeighbours(const Agent& agent, NeighbourList& neighbours) const;

    //! Convenience overload returning the neighbour list by value
    NeighbourList
    queryNeighbours(const Agent& agent) const;

    //! Exchanges contents with other
    void
    swap(SpatialGrid& other);

    /// \name Data access methods
    //@{
    double
    getCellSize() const;
    size_t
    getCols() const;
    size_t
    getRows() const;
    size_t
    numAgents() const;
    //! Flat index of the (clamped) cell containing p
    size_t
    cellIndex(const Point& p) const;
    const Cell&
    operator[](const size_t cell) const;
    //@}

  private:
    void
    cellCoords(const Point& p, size_t& cx, size_t& cy) const;

    std::vector<Cell> cells_;
    double cellSize_;
    size_t cols_;
    size_t rows_;
    size_t numAgents_;
  };

}

#endif /* SPATIALGRID_HPP_ */
