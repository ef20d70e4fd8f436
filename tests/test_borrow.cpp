// Copyright (c) 2018-2024 TU Delft 3D geoinformation group, Ravi Peters (3DGI),
// and Balazs Dukai (3DGI)

// This file is part of geobind.

// geobind is free software: you can redistribute it and/or modify it under
// the terms of the GNU General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version. geobind is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more
// details. You should have received a copy of the GNU General Public License
// along with geobind. If not, see <https://www.gnu.org/licenses/>.

// Author(s):
// Balazs Dukai


#include <geobind/common/borrow.hpp>
#include <geobind/common/errors.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>

using namespace geobind;

TEST_CASE("borrow guards follow their epoch") {
  Epoch epoch;
  auto guard = epoch.issue();
  REQUIRE(guard.is_alive());
  REQUIRE_NOTHROW(guard.check("view"));

  epoch.advance();
  REQUIRE_FALSE(guard.is_alive());
  REQUIRE_THROWS_AS(guard.check("view"), BorrowExpiredError);

  // guards issued after an advance are alive again
  auto fresh = epoch.issue();
  REQUIRE(fresh.is_alive());
  auto copy = fresh;
  epoch.advance();
  REQUIRE_FALSE(copy.is_alive());
}

TEST_CASE("moving an epoch keeps its guards") {
  Epoch epoch;
  auto guard = epoch.issue();
  Epoch moved = std::move(epoch);
  REQUIRE(guard.is_alive());

  // a moved-from epoch issues dead guards and cannot advance
  REQUIRE_FALSE(epoch.issue().is_alive());
  epoch.advance();
  REQUIRE(guard.is_alive());

  moved.advance();
  REQUIRE_FALSE(guard.is_alive());
}

TEST_CASE("default guards are never alive") {
  BorrowGuard guard;
  REQUIRE_FALSE(guard.is_alive());
  try {
    guard.check("RasterBand");
    FAIL("expected BorrowExpiredError");
  } catch (const BorrowExpiredError& e) {
    REQUIRE(std::string(e.what()).find("RasterBand") != std::string::npos);
  }
}
