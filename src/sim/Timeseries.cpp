/*************************************************************************
 *  ./src/sim/Timeseries.cpp
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
 * Timeseries.cpp
 */

#include <cmath>
#include <sstream>

#include "Timeseries.hpp"
#include "EpiSpreadException.hpp"

// Absorbs the drift of summing many small steps
#define TIMER_TOL 1e-9

namespace EpiSpread
{

  StateCounts::StateCounts() :
    healthy(0), infected(0), asymptomatic(0), recovered(0), vaccinated(0)
  {
  }

  void
  StateCounts::add(const DiseaseState_e state)
  {
    switch (state)
      {
    case HEALTHY:
      ++healthy;
      break;
    case INFECTED:
      ++infected;
      break;
    case ASYMPTOMATIC:
      ++asymptomatic;
      break;
    case RECOVERED:
      ++recovered;
      break;
    case VACCINATED:
      ++vaccinated;
      break;
      }
  }

  size_t
  StateCounts::total() const
  {
    return healthy + infected + asymptomatic + recovered + vaccinated;
  }

  bool
  StateCounts::operator==(const StateCounts& rhs) const
  {
    return healthy == rhs.healthy && infected == rhs.infected
        && asymptomatic == rhs.asymptomatic && recovered == rhs.recovered
        && vaccinated == rhs.vaccinated;
  }

  bool
  StateCounts::operator!=(const StateCounts& rhs) const
  {
    return !(*this == rhs);
  }

  Sample::Sample() :
    t(0.0), healthy(0.0), infected(0.0), asymptomatic(0.0), recovered(0.0),
        vaccinated(0.0)
  {
  }

  Sample::Sample(const simTime_t time, const StateCounts& counts) :
    t(time), healthy(counts.healthy), infected(counts.infected),
        asymptomatic(counts.asymptomatic), recovered(counts.recovered),
        vaccinated(counts.vaccinated)
  {
  }

  bool
  Sample::operator==(const Sample& rhs) const
  {
    return t == rhs.t && healthy == rhs.healthy && infected == rhs.infected
        && asymptomatic == rhs.asymptomatic && recovered == rhs.recovered
        && vaccinated == rhs.vaccinated;
  }

  TimeseriesRecorder::TimeseriesRecorder(const simTime_t interval) :
    interval_(interval), timer_(0.0)
  {
    if (!(interval_ > 0.0))
      throw range_exception("sampling interval must be positive");
  }

  TimeseriesRecorder::~TimeseriesRecorder()
  {
  }

  void
  TimeseriesRecorder::clear()
  {
    samples_.clear();
    timer_ = 0.0;
  }

  bool
  TimeseriesRecorder::accumulate(const simTime_t dt)
  {
    timer_ += dt;
    if (timer_ + TIMER_TOL >= interval_)
      {
        timer_ = 0.0;
        return true;
      }
    return false;
  }

  void
  TimeseriesRecorder::record(const Sample& sample)
  {
    if (!samples_.empty() && sample.t < samples_.back().t)
      {
        std::stringstream msg;
        msg << "Sample at t=" << sample.t << " precedes the last sample at t="
            << samples_.back().t;
        throw data_exception(msg.str());
      }
    samples_.push_back(sample);
  }

  void
  TimeseriesRecorder::replace(const Timeseries& samples)
  {
    for(size_t i = 1; i < samples.size(); ++i)
      {
        if (samples[i].t < samples[i-1].t)
          {
            std::stringstream msg;
            msg << "Timeseries record " << i << " (t=" << samples[i].t
                << ") precedes record " << i-1 << " (t=" << samples[i-1].t << ")";
            throw data_exception(msg.str());
          }
      }
    samples_ = samples;
    timer_ = 0.0;
  }

  const Timeseries&
  TimeseriesRecorder::getSamples() const
  {
    return samples_;
  }

  size_t
  TimeseriesRecorder::size() const
  {
    return samples_.size();
  }

  bool
  TimeseriesRecorder::empty() const
  {
    return samples_.empty();
  }

  simTime_t
  TimeseriesRecorder::getInterval() const
  {
    return interval_;
  }

  simTime_t
  roundTime(const simTime_t t)
  {
    return std::floor(t * 1000.0 + 0.5) / 1000.0;
  }

}
