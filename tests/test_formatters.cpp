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


#include <geobind/common/common.hpp>
#include <geobind/common/formatters.hpp>

#include <catch2/catch_test_macros.hpp>

#include <fmt/format.h>

#include <optional>

using namespace geobind;

TEST_CASE("formatters") {
  Envelope envelope{0, 2, 0, 1};
  REQUIRE(fmt::format("{}", envelope) == "[0,0,2,1]");
  REQUIRE(fmt::format("{}", std::optional<Envelope>()) == "");
  REQUIRE(fmt::format("{}", arr3d{1.5, 2, 3}) == "[1.5,2,3]");
  REQUIRE(fmt::format("{}", CplErrType::Warning) == "Warning");
}

TEST_CASE("date times in IETF format") {
  DateTime utc{{2024, 3, 7}, {9, 5, 30.5f, 100}};
  REQUIRE(utc.format_to_ietf() == "2024-03-07T09:05:30Z");
  REQUIRE(fmt::format("{}", utc) == "2024-03-07T09:05:30Z");

  DateTime cet{{2024, 3, 7}, {9, 5, 0, 104}};
  REQUIRE(cet.format_to_ietf() == "2024-03-07T09:05:00+01:00");

  DateTime west{{1999, 12, 31}, {23, 59, 59, 90}};
  REQUIRE(west.format_to_ietf() == "1999-12-31T23:59:59-02:30");
}
