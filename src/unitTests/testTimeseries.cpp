/*************************************************************************
 *  ./src/unitTests/testTimeseries.cpp
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
 * testTimeseries.cpp
 */

#include <catch2/catch.hpp>

#include "Timeseries.hpp"

using namespace EpiSpread;

namespace
{
  Sample
  makeSample(simTime_t t, double healthy, double infected)
  {
    Sample s;
    s.t = t;
    s.healthy = healthy;
    s.infected = infected;
    return s;
  }
}

const char* tag_timeseries = "[timeseries]";

TEST_CASE("state counts tally each state", tag_timeseries) {
  StateCounts counts;
  counts.add(HEALTHY);
  counts.add(HEALTHY);
  counts.add(INFECTED);
  counts.add(ASYMPTOMATIC);
  counts.add(RECOVERED);
  counts.add(VACCINATED);

  REQUIRE(counts.healthy == 2);
  REQUIRE(counts.infected == 1);
  REQUIRE(counts.asymptomatic == 1);
  REQUIRE(counts.recovered == 1);
  REQUIRE(counts.vaccinated == 1);
  REQUIRE(counts.total() == 6);

  Sample s(1.5, counts);
  REQUIRE(s.t == 1.5);
  REQUIRE(s.healthy == 2.0);
  REQUIRE(s.vaccinated == 1.0);
}

TEST_CASE("recorder signals a sample every interval", tag_timeseries) {
  TimeseriesRecorder recorder;
  REQUIRE(recorder.getInterval() == 0.5);

  int due = 0;
  for(int i=0; i<50; ++i)
    if(recorder.accumulate(0.1)) due++;
  REQUIRE(due == 10);

  // Timer resets to zero, so an overshoot is not carried over
  recorder.clear();
  REQUIRE_FALSE(recorder.accumulate(0.3));
  REQUIRE(recorder.accumulate(0.3));
  REQUIRE_FALSE(recorder.accumulate(0.3));
  REQUIRE(recorder.accumulate(0.3));
}

TEST_CASE("recorder rejects a non-positive interval", tag_timeseries) {
  CHECK_THROWS_AS(TimeseriesRecorder(0.0), range_exception);
}

TEST_CASE("records must not go back in time", tag_timeseries) {
  TimeseriesRecorder recorder;
  recorder.record(makeSample(0.5, 10, 0));
  recorder.record(makeSample(0.5, 9, 1));
  recorder.record(makeSample(1.0, 8, 2));
  REQUIRE(recorder.size() == 3);

  CHECK_THROWS_AS(recorder.record(makeSample(0.9, 7, 3)), data_exception);
  REQUIRE(recorder.size() == 3);
}

TEST_CASE("replace validates before it changes anything", tag_timeseries) {
  TimeseriesRecorder recorder;
  recorder.record(makeSample(0.5, 10, 0));

  Timeseries bad;
  bad.push_back(makeSample(2.0, 1, 1));
  bad.push_back(makeSample(1.0, 1, 1));
  CHECK_THROWS_AS(recorder.replace(bad), data_exception);
  REQUIRE(recorder.size() == 1);
  REQUIRE(recorder.getSamples()[0] == makeSample(0.5, 10, 0));

  Timeseries good;
  good.push_back(makeSample(0.0, 95, 5));
  good.push_back(makeSample(1.0, 90.5, 9.5));
  recorder.replace(good);
  REQUIRE(recorder.getSamples() == good);

  recorder.replace(Timeseries());
  REQUIRE(recorder.empty());
}

TEST_CASE("time is rounded to the millisecond", tag_timeseries) {
  REQUIRE(roundTime(0.49999999) == 0.5);
  REQUIRE(roundTime(1.2344) == Approx(1.234));
  REQUIRE(roundTime(1.2346) == Approx(1.235));
  REQUIRE(roundTime(0.0) == 0.0);
}
