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


#include <geobind/common/config.hpp>
#include <geobind/common/errors.hpp>

#include <catch2/catch_test_macros.hpp>

#include <thread>

using namespace geobind;

TEST_CASE("global config options") {
  set_config_option("GDAL_CACHEMAX", "128");
  REQUIRE(get_config_option("GDAL_CACHEMAX", "") == "128");

  set_config_option("GEOBIND_TEST_OPTION", "256");
  REQUIRE(get_config_option("GEOBIND_TEST_OPTION", "") == "256");
  clear_config_option("GEOBIND_TEST_OPTION");
  REQUIRE(get_config_option("GEOBIND_TEST_OPTION", "DEFAULT") == "DEFAULT");

  REQUIRE_THROWS_AS(set_config_option(std::string("A\0B", 3), "1"),
                    StringConversionError);
}

TEST_CASE("thread local config options") {
  set_thread_local_config_option("GEOBIND_TL_OPTION", "main");
  std::string seen_by_other;
  std::thread other([&] {
    seen_by_other = get_thread_local_config_option("GEOBIND_TL_OPTION", "");
  });
  other.join();
  REQUIRE(get_thread_local_config_option("GEOBIND_TL_OPTION", "") == "main");
  REQUIRE(seen_by_other.empty());

  // thread local options take precedence in the global lookup
  REQUIRE(get_config_option("GEOBIND_TL_OPTION", "") == "main");
  clear_thread_local_config_option("GEOBIND_TL_OPTION");
  REQUIRE(get_thread_local_config_option("GEOBIND_TL_OPTION", "none") ==
          "none");
}

TEST_CASE("runtime configuration") {
  RuntimeConfig cfg;
  REQUIRE(cfg.is_valid());

  cfg.config_options["GEOBIND_RUNTIME_OPTION"] = "YES";
  cfg.log_level = logger::LogLevel::warning;
  configure(cfg);
  REQUIRE(get_config_option("GEOBIND_RUNTIME_OPTION", "") == "YES");
  REQUIRE(logger::Logger::get_logger().level() == logger::LogLevel::warning);
  clear_config_option("GEOBIND_RUNTIME_OPTION");
  logger::Logger::get_logger().set_level(logger::LogLevel::default_level);

  RuntimeConfig bad;
  bad.config_options["KEY=VALUE"] = "1";
  REQUIRE_FALSE(bad.is_valid());
  REQUIRE_THROWS_AS(configure(bad), BadArgumentError);

  RuntimeConfig empty_log;
  empty_log.log_file = "";
  REQUIRE_FALSE(empty_log.is_valid());
}
