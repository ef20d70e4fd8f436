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


#include <geobind/common/error_handler.hpp>
#include <geobind/common/formatters.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cpl_error.h>
#include <fmt/format.h>

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace geobind;

TEST_CASE("error handler receives errors in order") {
  std::vector<ErrorRecord> records;
  std::mutex mutex;
  set_error_handler([&](CplErrType severity, int code, std::string_view msg) {
    std::lock_guard lock(mutex);
    records.push_back({severity, code, std::string(msg)});
  });

  CPLError(CE_Failure, 42, "foo");
  CPLError(CE_Warning, 1, "bar");
  remove_error_handler();
  CPLErrorReset();

  std::vector<ErrorRecord> expected{{CplErrType::Failure, 42, "foo"},
                                    {CplErrType::Warning, 1, "bar"}};
  REQUIRE(records == expected);
  REQUIRE(fmt::format("{}", records[0]) == R"((Failure, 42, "foo"))");

  // removed handlers are no longer called
  {
    ScopedQuietErrors quiet;
    CPLError(CE_Failure, 3, "after removal");
  }
  CPLErrorReset();
  REQUIRE(records.size() == 2);
}

TEST_CASE("replacing the error handler while errors are raised") {
  std::atomic<int> calls{0};
  std::atomic<bool> stop{false};
  auto install = [&] {
    while (!stop) {
      set_error_handler(
          [&](CplErrType, int, std::string_view) { calls.fetch_add(1); });
    }
  };
  set_error_handler(
      [&](CplErrType, int, std::string_view) { calls.fetch_add(1); });
  std::thread first(install);
  std::thread second(install);
  std::thread reporter([&] {
    for (int i = 0; i < 200; ++i) {
      CPLError(CE_Warning, CPLE_AppDefined, "race %d", i);
    }
    stop = true;
  });
  reporter.join();
  first.join();
  second.join();
  remove_error_handler();

  // every error reached one of the installed handlers
  REQUIRE(calls.load() == 200);
}

TEST_CASE("native errors are reported as exceptions") {
  ScopedQuietErrors quiet;
  CPLError(CE_Failure, CPLE_OpenFailed, "cannot open");
  auto err = detail::last_cpl_err(CE_Failure);
  REQUIRE(err.severity() == CplErrType::Failure);
  REQUIRE(err.code() == CPLE_OpenFailed);
  REQUIRE(err.message() == "cannot open");
  CPLErrorReset();
}
