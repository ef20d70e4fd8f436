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

#pragma once

#include <geobind/geobind.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>

namespace geobind::test {

  /** @brief A fresh directory under the system temp dir, removed at scope
   * exit. */
  class TempDir {
   public:
    TempDir() {
      static std::atomic<int> counter{0};
      std::random_device rd;
      path_ = std::filesystem::temp_directory_path() /
              ("geobind_test_" + std::to_string(rd()) + "_" +
               std::to_string(counter++));
      std::filesystem::create_directories(path_);
    }
    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const {
      return (path_ / name).string();
    }

   private:
    std::filesystem::path path_;
  };

  /**
   * @brief Writes a 100x50 GeoTIFF with 3 byte bands. Band 1 holds 1
   * everywhere except the 2x3 window at (20, 30), which reads
   * 7 7 / 7 10 / 8 12. Bands 2 and 3 hold 2 and 3.
   */
  inline void write_tinymarble(const std::string& path) {
    auto driver = Driver::get_by_name("GTiff");
    auto dataset = driver.create_with_band_type<std::uint8_t>(path, 100, 50, 3);
    dataset.set_geo_transform({0, 1, 0, 0, 0, -1});
    auto band1 = dataset.rasterband(1);
    band1.fill(1);
    band1.write<std::uint8_t>(
        {20, 30}, {2, 3},
        Buffer<std::uint8_t>({2, 3}, std::vector<std::uint8_t>{7, 7, 7, 10, 8,
                                                               12}));
    dataset.rasterband(2).fill(2);
    dataset.rasterband(3).fill(3);
    dataset.close();
  }

  /** @brief GeoJSON with three points with an "id" and a "name" field. */
  inline const char* points_geojson() {
    return R"({
  "type": "FeatureCollection",
  "features": [
    {"type": "Feature", "properties": {"id": 1, "name": "a"},
     "geometry": {"type": "Point", "coordinates": [1.0, 1.0]}},
    {"type": "Feature", "properties": {"id": 2, "name": "b"},
     "geometry": {"type": "Point", "coordinates": [2.0, 2.0]}},
    {"type": "Feature", "properties": {"id": 3, "name": "c"},
     "geometry": {"type": "Point", "coordinates": [10.0, 10.0]}}
  ]
})";
  }

}  // namespace geobind::test
