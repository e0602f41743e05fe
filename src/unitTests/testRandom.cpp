/*************************************************************************
 *  ./src/unitTests/testRandom.cpp
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
 * testRandom.cpp
 */

#include <stdexcept>
#include <catch2/catch.hpp>

#include "Random.hpp"

using namespace EpiSpread;

const char* tag_random = "[random]";

TEST_CASE("equal seeds give equal streams", tag_random) {
  Random a(42);
  Random b(42);

  for(int i=0; i<1000; ++i) {
      REQUIRE(a.uniform() == b.uniform());
      REQUIRE(a.integer(17) == b.integer(17));
  }
  REQUIRE(a.getSeed() == 42);
}

TEST_CASE("different seeds give different streams", tag_random) {
  Random a(1);
  Random b(2);

  bool differ = false;
  for(int i=0; i<10; ++i)
    if(a.uniform() != b.uniform()) differ = true;
  REQUIRE(differ);
}

TEST_CASE("uniform stays within its bounds", tag_random) {
  Random random(7);

  for(int i=0; i<10000; ++i) {
      double u = random.uniform();
      REQUIRE(u >= 0.0);
      REQUIRE(u < 1.0);

      double v = random.uniform(-0.02, 0.02);
      REQUIRE(v >= -0.02);
      REQUIRE(v <= 0.02);
  }
}

TEST_CASE("integer draws cover [0,n)", tag_random) {
  Random random(3);
  int counts[5] = {0, 0, 0, 0, 0};

  for(int i=0; i<5000; ++i) {
      size_t k = random.integer(5);
      REQUIRE(k < 5);
      counts[k]++;
  }
  for(int k=0; k<5; ++k) CHECK(counts[k] > 0);

  CHECK_THROWS_AS(random.integer(0), std::invalid_argument);
}

TEST_CASE("bernoulli respects its extremes", tag_random) {
  Random random(11);

  for(int i=0; i<1000; ++i) {
      REQUIRE_FALSE(random.bernoulli(0.0));
      REQUIRE(random.bernoulli(1.0));
  }

  int hits = 0;
  for(int i=0; i<10000; ++i)
    if(random.bernoulli(0.3)) hits++;
  CHECK(hits > 2700);
  CHECK(hits < 3300);
}
