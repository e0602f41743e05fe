/*************************************************************************
 *  ./src/unitTests/testConfiguration.cpp
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
 * testConfiguration.cpp
 */

#include <cstdio>
#include <fstream>
#include <limits>
#include <catch2/catch.hpp>

#include "Configuration.hpp"

using namespace EpiSpread;

const char* tag_config = "[configuration]";

TEST_CASE("defaults are valid", tag_config) {
  Configuration config;
  REQUIRE(config.population == 120);
  REQUIRE(config.initialInfected == 3);
  REQUIRE(config.speed == 1.0);
  REQUIRE(config.infectionRadius == 14.0);
  REQUIRE(config.baseProbability == 0.45);
  REQUIRE(config.recoveryTime == 12.0);
  REQUIRE(config.incubationTime == 0.0);
  REQUIRE(config.vaccinatedFraction == 0.0);
  REQUIRE(config.asymptomaticFraction == 0.0);
  REQUIRE(config.getBounds().width == 800.0);
  REQUIRE(config.getBounds().height == 600.0);
  REQUIRE(config.superSpreaders.empty());
  CHECK_NOTHROW(config.validate());
}

TEST_CASE("invalid parameters are rejected", tag_config) {
  Configuration config;

  SECTION("empty population") {
    config.population = 0;
    CHECK_THROWS_AS(config.validate(), configuration_error);
  }
  SECTION("zero radius") {
    config.infectionRadius = 0.0;
    CHECK_THROWS_AS(config.validate(), configuration_error);
  }
  SECTION("non-finite radius") {
    config.infectionRadius = std::numeric_limits<double>::quiet_NaN();
    CHECK_THROWS_AS(config.validate(), configuration_error);
  }
  SECTION("probability above one") {
    config.baseProbability = 1.5;
    CHECK_THROWS_AS(config.validate(), configuration_error);
  }
  SECTION("negative vaccinated fraction") {
    config.vaccinatedFraction = -0.1;
    CHECK_THROWS_AS(config.validate(), configuration_error);
  }
  SECTION("asymptomatic fraction above one") {
    config.asymptomaticFraction = 2.0;
    CHECK_THROWS_AS(config.validate(), configuration_error);
  }
  SECTION("zero recovery time") {
    config.recoveryTime = 0.0;
    CHECK_THROWS_AS(config.validate(), configuration_error);
  }
  SECTION("negative incubation") {
    config.incubationTime = -1.0;
    CHECK_THROWS_AS(config.validate(), configuration_error);
  }
  SECTION("negative speed") {
    config.speed = -1.0;
    CHECK_THROWS_AS(config.validate(), configuration_error);
  }
  SECTION("empty field") {
    config.fieldWidth = 0.0;
    CHECK_THROWS_AS(config.validate(), configuration_error);
  }
  SECTION("super-spreader outside the population") {
    config.superSpreaders.push_back(120);
    CHECK_THROWS_AS(config.validate(), configuration_error);
  }
}

TEST_CASE("fields needing too many grid cells are rejected", tag_config) {
  Configuration config;
  config.infectionRadius = 14.0;

  SECTION("cell count that would wrap a size_t") {
    config.fieldWidth = 28.0 * 274177.0;
    config.fieldHeight = 28.0 * 67280421310721.0;
    CHECK_THROWS_AS(config.validate(), configuration_error);
  }
  SECTION("cell count that wraps to zero") {
    config.fieldWidth = 28.0 * 8589934592.0;
    config.fieldHeight = 28.0 * 2147483648.0;
    CHECK_THROWS_AS(config.validate(), configuration_error);
  }
  SECTION("large but representable field") {
    config.fieldWidth = 1e6;
    config.fieldHeight = 1e6;
    CHECK_THROWS_AS(config.validate(), configuration_error);
  }
  SECTION("a field just inside the limit") {
    // 2048 x 2048 cells of side 28
    config.fieldWidth = 28.0 * 2048.0;
    config.fieldHeight = 28.0 * 2048.0;
    CHECK_NOTHROW(config.validate());
    config.fieldWidth = 28.0 * 2049.0;
    CHECK_THROWS_AS(config.validate(), configuration_error);
  }
}

TEST_CASE("boundary values are accepted", tag_config) {
  Configuration config;
  config.baseProbability = 1.0;
  config.vaccinatedFraction = 1.0;
  config.speed = 0.0;
  config.initialInfected = 1000;
  config.superSpreaders.push_back(119);
  CHECK_NOTHROW(config.validate());
}

TEST_CASE("presets overlay the current values", tag_config) {
  Configuration config;
  config.recoveryTime = 20.0;

  applyPreset(config, "fast");
  REQUIRE(config.population == 200);
  REQUIRE(config.baseProbability == 0.7);
  REQUIRE(config.speed == 1.4);
  REQUIRE(config.infectionRadius == 18.0);
  REQUIRE(config.recoveryTime == 20.0);

  applyPreset(config, "vaccination");
  REQUIRE(config.vaccinatedFraction == 0.6);
  REQUIRE(config.baseProbability == 0.2);
  REQUIRE(config.population == 200);

  applyPreset(config, "low");
  REQUIRE(config.baseProbability == 0.1);
  REQUIRE(config.infectionRadius == 8.0);

  applyPreset(config, "default");
  REQUIRE(config.population == 120);
  REQUIRE(config.recoveryTime == 12.0);

  CHECK_THROWS_AS(applyPreset(config, "extreme"), configuration_error);
}

TEST_CASE("grid cell size covers the radius", tag_config) {
  REQUIRE(gridCellSize(5.0) == MIN_CELL_SIZE);
  REQUIRE(gridCellSize(12.0) == 24.0);
  REQUIRE(gridCellSize(14.0) == 28.0);
}

TEST_CASE("XML files override only the keys they name", tag_config) {
  const char* filename = "epispread_test_config.xml";
  {
    std::ofstream file(filename);
    file << "<?xml version=\"1.0\"?>\n"
         << "<epispread><parameters>\n"
         << "  <population>50</population>\n"
         << "  <radius>20.5</radius>\n"
         << "  <recoverytime>4</recoverytime>\n"
         << "  <superspreaders><id>3</id><id>7</id></superspreaders>\n"
         << "</parameters></epispread>\n";
  }

  Configuration config;
  config.loadXml(filename);
  std::remove(filename);

  REQUIRE(config.population == 50);
  REQUIRE(config.infectionRadius == 20.5);
  REQUIRE(config.recoveryTime == 4.0);
  REQUIRE(config.initialInfected == 3);
  REQUIRE(config.baseProbability == 0.45);
  REQUIRE(config.superSpreaders.size() == 2);
  REQUIRE(config.superSpreaders[1] == 7);
  CHECK_NOTHROW(config.validate());
}
