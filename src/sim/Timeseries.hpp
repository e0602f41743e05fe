/*************************************************************************
 *  ./src/sim/Timeseries.hpp
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
 * Timeseries.hpp
 *
 *  Population counts sampled over simulated time.
 */

#ifndef TIMESERIES_HPP_
#define TIMESERIES_HPP_

#include <vector>

#include "types.hpp"
#include "Agent.hpp"
#include "Configuration.hpp"

namespace EpiSpread
{

  //! Number of agents in each disease state
  struct StateCounts
  {
    size_t healthy;
    size_t infected;
    size_t asymptomatic;
    size_t recovered;
    size_t vaccinated;

    StateCounts();
    void
    add(const DiseaseState_e state);
    size_t
    total() const;
    bool
    operator==(const StateCounts& rhs) const;
    bool
    operator!=(const StateCounts& rhs) const;
  };

  /*! \brief One timeseries record
   *
   * Counts are real-valued so that imported records, which need
   * not hold whole numbers, survive unchanged.
   */
  struct Sample
  {
    simTime_t t;
    double healthy;
    double infected;
    double asymptomatic;
    double recovered;
    double vaccinated;

    Sample();
    Sample(const simTime_t time, const StateCounts& counts);
    bool
    operator==(const Sample& rhs) const;
  };

  typedef std::vector<Sample> Timeseries;


  /*! \brief Accumulates samples at a fixed cadence
   *
   * The owner reports elapsed time through accumulate(); when the
   * sampling timer reaches the interval it is reset to zero and
   * the owner records a sample.
   */
  class TimeseriesRecorder
  {
  public:
    TimeseriesRecorder(const simTime_t interval = SAMPLE_INTERVAL);
    virtual
    ~TimeseriesRecorder();

    //! Empties the series and resets the sampling timer
    void
    clear();
    /*! Adds dt to the sampling timer
     * @return true if a sample is now due, in which case the timer
     * has been reset.
     */
    bool
    accumulate(const simTime_t dt);
    //! Appends a sample.  Throws data_exception if t would decrease.
    void
    record(const Sample& sample);
    /*! Replaces the whole series
     *
     * Used for imported data.  The series is left untouched if
     * samples is not ordered by t.
     * @throws data_exception on a decreasing timestamp
     */
    void
    replace(const Timeseries& samples);

    const Timeseries&
    getSamples() const;
    size_t
    size() const;
    bool
    empty() const;
    simTime_t
    getInterval() const;

  private:
    Timeseries samples_;
    simTime_t interval_;
    simTime_t timer_;
  };

  //! Rounds simulated time to the nearest millisecond
  simTime_t
  roundTime(const simTime_t t);

}

#endif /* TIMESERIES_HPP_ */
