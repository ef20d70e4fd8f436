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
#include <geobind/common/errors.hpp>
#include <geobind/srs/coord_transform.hpp>
#include <geobind/srs/spatial_ref.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <array>
#include <string>
#include <vector>

using namespace geobind;
using Catch::Matchers::WithinAbs;

TEST_CASE("spatial reference from an EPSG code") {
  auto srs = SpatialRef::from_epsg(4326);
  REQUIRE(srs.auth_name() == "EPSG");
  REQUIRE(srs.auth_code() == 4326);
  REQUIRE(srs.authority() == "EPSG:4326");
  REQUIRE(srs.name() == "WGS 84");
  REQUIRE(srs.is_geographic());
  REQUIRE_FALSE(srs.is_projected());
  REQUIRE_THAT(srs.semi_major(), WithinAbs(6378137.0, 1e-6));
  REQUIRE(srs.angular_units().name == "degree");

  auto area = srs.area_of_use();
  REQUIRE(area.has_value());
  REQUIRE_THAT(area->west_lon_degree, WithinAbs(-180.0, 1e-9));
}

TEST_CASE("spatial reference importers agree") {
  auto from_epsg = SpatialRef::from_epsg(28992);
  REQUIRE(from_epsg.is_projected());
  REQUIRE(from_epsg.linear_units().factor == 1.0);

  auto from_wkt = SpatialRef::from_wkt(from_epsg.to_wkt());
  REQUIRE(from_wkt == from_epsg);

  auto from_definition = SpatialRef::from_definition("EPSG:28992");
  REQUIRE(from_definition == from_epsg);

  auto from_proj4 = SpatialRef::from_proj4(
      "+proj=longlat +ellps=WGS84 +datum=WGS84 +no_defs");
  REQUIRE(from_proj4.is_geographic());
  REQUIRE(from_proj4.to_proj4().find("+proj=longlat") != std::string::npos);
  REQUIRE_FALSE(from_proj4.auth_code().has_value());

  REQUIRE(from_epsg.to_projjson().find("\"code\": 28992") != std::string::npos);
  REQUIRE_FALSE(from_epsg.to_pretty_wkt().empty());
}

TEST_CASE("invalid spatial reference definitions") {
  ScopedQuietErrors quiet;
  REQUIRE_THROWS_AS(SpatialRef::from_epsg(-1), OgrError);
  REQUIRE_THROWS_AS(SpatialRef::from_definition("not a crs"), OgrError);
  REQUIRE_THROWS_AS(SpatialRef::from_definition(std::string("EPSG:\0", 6)),
                    StringConversionError);
}

TEST_CASE("spatial reference copies") {
  auto srs = SpatialRef::from_epsg(3035);
  SpatialRef copy = srs;
  copy.set_axis_mapping_strategy(AxisMappingStrategy::TraditionalGisOrder);
  REQUIRE(srs.axis_mapping_strategy() ==
          AxisMappingStrategy::AuthorityCompliant);
  REQUIRE(copy.axis_mapping_strategy() ==
          AxisMappingStrategy::TraditionalGisOrder);

  SpatialRef moved = std::move(copy);
  REQUIRE(moved.auth_code() == 3035);
  REQUIRE(copy.c_ptr() == nullptr);
}

TEST_CASE("transform coordinates") {
  auto wgs84 = SpatialRef::from_epsg(4326);
  wgs84.set_axis_mapping_strategy(AxisMappingStrategy::TraditionalGisOrder);
  auto laea = SpatialRef::from_epsg(3035);
  CoordTransform transform(wgs84, laea);

  std::vector<double> x{23.43};
  std::vector<double> y{37.58};
  std::vector<double> z;
  transform.transform_coords(x, y, z);
  REQUIRE_THAT(x[0], WithinAbs(5509543.1508097, 1e-3));
  REQUIRE_THAT(y[0], WithinAbs(1716062.1916192223, 1e-3));

  SECTION("lengths must agree") {
    std::vector<double> x2{1, 2};
    std::vector<double> y1{1};
    REQUIRE_THROWS_AS(transform.transform_coords(x2, y1, z), BadArgumentError);
  }
}

TEST_CASE("transform coordinates out of range") {
  auto wgs84 = SpatialRef::from_epsg(4326);
  wgs84.set_axis_mapping_strategy(AxisMappingStrategy::TraditionalGisOrder);
  auto mercator = SpatialRef::from_epsg(3857);
  CoordTransform transform(wgs84, mercator);

  std::vector<double> x{1e6};
  std::vector<double> y{1e6};
  std::vector<double> z;
  ScopedQuietErrors quiet;
  REQUIRE_THROWS_AS(transform.transform_coords(x, y, z),
                    InvalidCoordinateRangeError);
  try {
    transform.transform_coords(x, y, z);
  } catch (const InvalidCoordinateRangeError& e) {
    REQUIRE(e.from() == "EPSG:4326");
    REQUIRE(e.to() == "EPSG:3857");
  }
}

TEST_CASE("transform between references without an authority") {
  auto lonlat = SpatialRef::from_proj4("+proj=longlat +datum=WGS84 +no_defs");
  auto mercator = SpatialRef::from_proj4(
      "+proj=merc +lon_0=0 +k=1 +x_0=0 +y_0=0 +datum=WGS84 +units=m +no_defs");
  REQUIRE_FALSE(mercator.authority().has_value());
  CoordTransform transform(lonlat, mercator);

  std::vector<double> x{0};
  std::vector<double> y{100};
  std::vector<double> z;
  ScopedQuietErrors quiet;
  try {
    transform.transform_coords(x, y, z);
    FAIL("latitude 100 has no mercator coordinate");
  } catch (const InvalidCoordinateRangeError& e) {
    REQUIRE_THAT(e.to(), Catch::Matchers::ContainsSubstring("+proj=merc"));
  }
}

TEST_CASE("transform bounds") {
  auto wgs84 = SpatialRef::from_epsg(4326);
  wgs84.set_axis_mapping_strategy(AxisMappingStrategy::TraditionalGisOrder);
  auto rd = SpatialRef::from_epsg(28992);
  rd.set_axis_mapping_strategy(AxisMappingStrategy::TraditionalGisOrder);

  CoordTransformOptions options;
  options.set_ballpark_allowed(false);
  CoordTransform transform(rd, wgs84, options);

  auto bounds = transform.transform_bounds({85000, 445000, 95000, 455000}, 21);
  // around Delft
  REQUIRE(bounds[0] > 4.2);
  REQUIRE(bounds[2] < 4.5);
  REQUIRE(bounds[1] > 51.9);
  REQUIRE(bounds[3] < 52.1);
  REQUIRE(bounds[0] < bounds[2]);
}
