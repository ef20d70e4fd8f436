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
// Ravi Peters


#include "test_utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

using namespace geobind;

TEST_CASE("in-memory files") {
  std::vector<std::uint8_t> bytes{'g', 'e', 'o', 'b', 'i', 'n', 'd'};
  create_mem_file("/vsimem/geobind_dir/a.txt", bytes);
  create_mem_file("/vsimem/geobind_dir/sub/b.txt", bytes);

  auto entries = read_dir("/vsimem/geobind_dir", false);
  REQUIRE(std::find(entries.begin(), entries.end(), "a.txt") != entries.end());
  auto all = read_dir("/vsimem/geobind_dir", true);
  REQUIRE(std::find(all.begin(), all.end(), "sub/b.txt") != all.end());

  auto size = call_on_mem_file_bytes(
      "/vsimem/geobind_dir/a.txt",
      [](std::span<const std::uint8_t> data) { return data.size(); });
  REQUIRE(size == bytes.size());

  // the owned copy takes the file out of the in-memory file system
  auto owned = get_vsi_mem_file_bytes_owned("/vsimem/geobind_dir/a.txt");
  REQUIRE(owned == bytes);
  {
    ScopedQuietErrors quiet;
    REQUIRE_THROWS_AS(
        call_on_mem_file_bytes("/vsimem/geobind_dir/a.txt",
                               [](std::span<const std::uint8_t>) { return 0; }),
        NullPointerError);
  }

  unlink_mem_file("/vsimem/geobind_dir/sub/b.txt");
  REQUIRE_THROWS_AS(unlink_mem_file("/vsimem/geobind_dir/sub/b.txt"),
                    GeobindError);

  ScopedQuietErrors quiet;
  REQUIRE_THROWS_AS(read_dir("/vsimem/not_a_dir", false), NullPointerError);
}

TEST_CASE("in-memory file over caller memory") {
  std::string json = test::points_geojson();
  std::vector<std::uint8_t> bytes(json.begin(), json.end());
  {
    MemFileRef file("/vsimem/geobind_ref.geojson", bytes);
    auto dataset = Dataset::open(file.file_name());
    REQUIRE(dataset.layer(0).feature_count() == 3);

    MemFileRef moved = std::move(file);
    REQUIRE(moved.file_name() == "/vsimem/geobind_ref.geojson");
    REQUIRE(file.file_name().empty());
  }
  ScopedQuietErrors quiet;
  REQUIRE_THROWS_AS(get_vsi_mem_file_bytes_owned("/vsimem/geobind_ref.geojson"),
                    NullPointerError);
  // the caller keeps ownership of the bytes
  REQUIRE(bytes.size() == json.size());
}

TEST_CASE("owned copy of a file over caller memory") {
  std::vector<std::uint8_t> bytes{'g', 'e', 'o', 'b', 'i', 'n', 'd'};
  MemFileRef file("/vsimem/geobind_ref.bin", bytes);

  auto owned = get_vsi_mem_file_bytes_owned(file.file_name());
  REQUIRE(owned == bytes);
  REQUIRE(owned.data() != bytes.data());
  // the file is gone, the caller's buffer is untouched
  owned[0] = 'x';
  REQUIRE(bytes[0] == 'g');
  ScopedQuietErrors quiet;
  REQUIRE_THROWS_AS(
      call_on_mem_file_bytes(file.file_name(),
                             [](std::span<const std::uint8_t>) { return 0; }),
      NullPointerError);
}

TEST_CASE("rasters in memory") {
  test::write_tinymarble("/vsimem/geobind_tinymarble.tif");
  auto bytes = get_vsi_mem_file_bytes_owned("/vsimem/geobind_tinymarble.tif");
  REQUIRE(bytes.size() > 4);
  // little endian TIFF
  REQUIRE(bytes[0] == 'I');
  REQUIRE(bytes[1] == 'I');

  create_mem_file("/vsimem/geobind_copy.tif", bytes);
  {
    auto dataset = Dataset::open("/vsimem/geobind_copy.tif");
    REQUIRE(dataset.raster_count() == 3);
  }
  unlink_mem_file("/vsimem/geobind_copy.tif");
}
