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

#include "test_utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace geobind;

namespace {
  struct PointsFile {
    PointsFile() {
      std::string_view json = test::points_geojson();
      create_mem_file(path, {reinterpret_cast<const std::uint8_t*>(json.data()),
                             json.size()});
    }
    ~PointsFile() { unlink_mem_file(path); }
    std::string path = "/vsimem/geobind_programs.geojson";
  };
}  // namespace

TEST_CASE("vector translate to a path") {
  PointsFile file;
  test::TempDir tmp;
  auto source = Dataset::open(file.path);

  VectorTranslateOptions options({"-f", "GPKG", "-nln", "points"});
  auto out = vector_translate(
      source, DatasetDestination::path(tmp.file("points.gpkg")), &options);
  REQUIRE(out.driver().short_name() == "GPKG");
  REQUIRE(out.layer_by_name("points").feature_count() == 3);

  // the source stays usable
  REQUIRE(source.layer(0).feature_count() == 3);
}

TEST_CASE("vector translate into an open dataset") {
  PointsFile file;
  test::TempDir tmp;
  auto source = Dataset::open(file.path);
  auto target =
      Driver::get_by_name("GPKG").create_vector_only(tmp.file("target.gpkg"));

  SECTION("the result takes over the dataset") {
    auto guard = target.borrow();
    GDALDatasetH handle = target.c_ptr();
    VectorTranslateOptions options({"-nln", "copied"});
    auto out = vector_translate(
        source, DatasetDestination::dataset(std::move(target)), &options);
    REQUIRE(out.c_ptr() == handle);
    REQUIRE_FALSE(guard.is_alive());
    REQUIRE(out.layer_by_name("copied").feature_count() == 3);
  }

  SECTION("a failed translation closes the dataset") {
    LayerOptions layer_options;
    layer_options.name = "copied";
    layer_options.ty = wkbPoint;
    target.create_layer(layer_options);
    auto guard = target.borrow();
    // the layer exists and neither -append nor -overwrite is given
    VectorTranslateOptions options({"-nln", "copied"});
    ScopedQuietErrors quiet;
    REQUIRE_THROWS_AS(
        vector_translate(source,
                         DatasetDestination::dataset(std::move(target)),
                         &options),
        NullPointerError);
    REQUIRE_FALSE(guard.is_alive());
  }
}

TEST_CASE("program options are parsed up front") {
  ScopedQuietErrors quiet;
  REQUIRE_THROWS_AS(VectorTranslateOptions({"-not_an_option"}),
                    NullPointerError);
  REQUIRE_THROWS_AS(BuildVrtOptions({"-resolution", "nonsense"}),
                    NullPointerError);
}

TEST_CASE("build a VRT of rasters") {
  test::TempDir tmp;
  auto driver = Driver::get_by_name("GTiff");
  std::vector<std::string> paths;
  for (int i = 0; i < 2; ++i) {
    auto path = tmp.file("tile" + std::to_string(i) + ".tif");
    auto tile = driver.create_with_band_type<std::uint8_t>(path, 4, 4, 1);
    tile.set_geo_transform({4.0 * i, 1, 0, 4, 0, -1});
    tile.rasterband(1).fill(10 + i);
    tile.close();
    paths.push_back(path);
  }

  auto vrt = build_vrt("", paths);
  REQUIRE(vrt.driver().short_name() == "VRT");
  REQUIRE(vrt.raster_size() == Size2{8, 4});
  auto values = vrt.rasterband(1).read_band_as<std::uint8_t>();
  REQUIRE(values(0, 0) == 10);
  REQUIRE(values(7, 3) == 11);

  BuildVrtOptions options({"-separate"});
  auto separate = build_vrt(tmp.file("separate.vrt"), paths, &options);
  REQUIRE(separate.raster_count() == 2);

  ScopedQuietErrors quiet;
  REQUIRE_THROWS_AS(build_vrt("", std::vector<std::string>{}),
                    NullPointerError);
}
