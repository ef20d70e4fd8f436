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


#include <geobind/common/cpl_string.hpp>
#include <geobind/common/errors.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <variant>

using namespace geobind;

namespace {
  CslStringList fixture() {
    CslStringList list{{"ONE", "1"}, {"TWO", "2"}, {"THREE", "3"}};
    list.add_string("SOME_FLAG");
    return list;
  }
}  // namespace

TEST_CASE("csl string list name values") {
  auto list = fixture();
  REQUIRE(list.size() == 4);
  REQUIRE(list.fetch_name_value("ONE") == "1");
  REQUIRE(list.fetch_name_value("one") == "1");
  REQUIRE_FALSE(list.fetch_name_value("FOUR").has_value());
  REQUIRE(list.fetch_name_value_or("FOUR", "4") == "4");

  list.set_name_value("ONE", "uno");
  REQUIRE(list.fetch_name_value("ONE") == "uno");
  REQUIRE(list.size() == 4);
}

TEST_CASE("csl string list from pairs") {
  CslStringList list{{"KEY", "128"}};
  REQUIRE(list.fetch_name_value("KEY") == "128");
  REQUIRE(list.fetch_name_value_or("OTHER", "default") == "default");
}

TEST_CASE("csl string list search") {
  auto list = fixture();
  REQUIRE(list.find_string("one=1") == 0);
  REQUIRE_FALSE(list.find_string("TWO=").has_value());
  REQUIRE(list.find_string_case_sensitive("ONE=1") == 0);
  REQUIRE_FALSE(list.find_string_case_sensitive("one=1").has_value());
  REQUIRE(list.partial_find_string("=1") == 0);
  REQUIRE(list.partial_find_string("FLAG") == 3);
  REQUIRE_FALSE(list.partial_find_string("three").has_value());

  REQUIRE(list.get_field(1) == "TWO=2");
  REQUIRE_FALSE(list.get_field(4).has_value());
}

TEST_CASE("csl string list entries") {
  auto entries = fixture().entries();
  REQUIRE(entries.size() == 4);
  REQUIRE(std::get<CslAssign>(entries[0]) == CslAssign{"ONE", "1"});
  REQUIRE(std::get<CslArg>(entries[3]) == CslArg{"SOME_FLAG"});

  auto pairs = fixture().to_pairs();
  REQUIRE(pairs.size() == 3);
  REQUIRE(pairs[2].first == "THREE");

  REQUIRE(std::get<CslAssign>(parse_csl_entry("A=b=c")) ==
          CslAssign{"A", "b=c"});
}

TEST_CASE("csl string list rejects invalid input") {
  CslStringList list;
  REQUIRE(list.empty());
  REQUIRE_THROWS_AS(list.set_name_value("", "x"), BadArgumentError);
  REQUIRE_THROWS_AS(list.set_name_value("A B", "x"), BadArgumentError);
  REQUIRE_THROWS_AS(list.set_name_value("KEY", "x\ny"), BadArgumentError);
  REQUIRE_THROWS_AS(list.add_string(std::string("a\0b", 3)),
                    StringConversionError);
  REQUIRE(list.empty());
}

TEST_CASE("csl string list copies are independent") {
  auto list = fixture();
  CslStringList copy = list;
  copy.set_name_value("TWO", "zwei");
  REQUIRE(list.fetch_name_value("TWO") == "2");
  REQUIRE(copy.fetch_name_value("TWO") == "zwei");

  CslStringList moved = std::move(copy);
  REQUIRE(moved.size() == 4);
  REQUIRE(copy.as_ptr() == nullptr);

  auto from_strings = CslStringList::from_strings({"A=1", "B"});
  REQUIRE(from_strings.size() == 2);
  REQUIRE(from_strings.fetch_name_value("A") == "1");
}
