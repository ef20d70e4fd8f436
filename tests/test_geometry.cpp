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


#include <geobind/common/error_handler.hpp>
#include <geobind/common/errors.hpp>
#include <geobind/srs/coord_transform.hpp>
#include <geobind/srs/spatial_ref.hpp>
#include <geobind/vector/geometry.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace geobind;
using Catch::Matchers::WithinAbs;

TEST_CASE("geometry from text formats") {
  auto polygon = Geometry::from_wkt("POLYGON ((0 0,4 0,4 3,0 3,0 0))");
  REQUIRE(polygon.is_owned());
  REQUIRE(polygon.geometry_type() == wkbPolygon);
  REQUIRE(polygon.geometry_name() == "POLYGON");
  REQUIRE(polygon.geometry_count() == 1);
  REQUIRE_THAT(polygon.area(), WithinAbs(12.0, 1e-12));
  REQUIRE(polygon.envelope() == Envelope{0, 4, 0, 3});
  REQUIRE(polygon == Geometry::bbox(0, 0, 4, 3));

  auto point = Geometry::from_geojson(R"({"type":"Point","coordinates":[1,2]})");
  REQUIRE(point.wkt() == "POINT (1 2)");
  REQUIRE(point.json().find("\"Point\"") != std::string::npos);

  auto from_wkb = Geometry::from_wkb(polygon.wkb());
  REQUIRE(from_wkb == polygon);

  ScopedQuietErrors quiet;
  REQUIRE_THROWS_AS(Geometry::from_wkt("POLYGON ((0 0"), OgrError);
  REQUIRE_THROWS_AS(Geometry::from_wkb(std::vector<std::uint8_t>{1, 2, 3}),
                    OgrError);
  REQUIRE_THROWS_AS(Geometry::from_geojson("{}"), NullPointerError);
}

TEST_CASE("line string points") {
  auto line = Geometry::empty(wkbLineString25D);
  REQUIRE(line.is_empty());
  line.add_point({0, 0, 1});
  line.add_point({3, 4, 2});
  REQUIRE(line.point_count() == 2);
  REQUIRE_THAT(line.length(), WithinAbs(5.0, 1e-12));
  REQUIRE(line.get_point(1) == arr3d{3, 4, 2});

  line.set_point(0, {1, 1, 1});
  // setting one past the end appends
  line.set_point(2, {5, 5, 5});
  REQUIRE(line.get_point_vec() ==
          vec3d{{1, 1, 1}, {3, 4, 2}, {5, 5, 5}});
  auto envelope = line.envelope_3d();
  REQUIRE(envelope.min_z == 1);
  REQUIRE(envelope.max_z == 5);

  REQUIRE_THROWS_AS(line.get_point(3), BadArgumentError);
  REQUIRE_THROWS_AS(line.set_point(4, {0, 0, 0}), BadArgumentError);
}

TEST_CASE("sub-geometries") {
  auto multi = Geometry::empty(wkbMultiPolygon);
  multi.add_geometry(Geometry::bbox(0, 0, 1, 1));
  multi.add_geometry(Geometry::bbox(2, 2, 4, 4));
  REQUIRE(multi.geometry_count() == 2);
  REQUIRE_THAT(multi.area(), WithinAbs(5.0, 1e-12));

  auto second = multi.get_geometry(1);
  REQUIRE_FALSE(second.is_owned());
  REQUIRE_THAT(second.area(), WithinAbs(4.0, 1e-12));
  auto ring = second.get_geometry(0);
  REQUIRE(ring.point_count() == 5);
  REQUIRE_THROWS_AS(multi.get_geometry(2), BadArgumentError);

  SECTION("views survive a move of the owner") {
    Geometry moved = std::move(multi);
    REQUIRE(ring.point_count() == 5);
  }

  SECTION("views expire with the owner") {
    { Geometry dropped = std::move(multi); }
    REQUIRE_THROWS_AS(second.area(), BorrowExpiredError);
    REQUIRE_THROWS_AS(ring.point_count(), BorrowExpiredError);
  }

  SECTION("clones of views are owned") {
    auto copy = second.clone();
    REQUIRE(copy.is_owned());
    OGRGeometryH handle = copy.release();
    REQUIRE(handle != nullptr);
    OGR_G_DestroyGeometry(handle);
  }
}

TEST_CASE("moved-from geometries") {
  auto point = Geometry::from_wkt("POINT (1 2)");
  Geometry other = std::move(point);
  REQUIRE(other.wkt() == "POINT (1 2)");
  REQUIRE_THROWS_AS(point.wkt(), BorrowExpiredError);
}

TEST_CASE("reproject geometries") {
  auto wgs84 = SpatialRef::from_epsg(4326);
  wgs84.set_axis_mapping_strategy(AxisMappingStrategy::TraditionalGisOrder);
  auto laea = SpatialRef::from_epsg(3035);

  auto point = Geometry::from_wkt("POINT (23.43 37.58)");
  point.set_spatial_ref(wgs84);
  REQUIRE(point.spatial_ref()->auth_code() == 4326);

  auto projected = point.transform_to(laea);
  auto xyz = projected.get_point(0);
  REQUIRE_THAT(xyz[0], WithinAbs(5509543.1508097, 1e-3));
  REQUIRE_THAT(xyz[1], WithinAbs(1716062.1916192223, 1e-3));
  // the source is left untouched
  REQUIRE(point.get_point(0)[0] == 23.43);

  CoordTransform back(laea, wgs84);
  projected.transform_inplace(back);
  REQUIRE_THAT(projected.get_point(0)[0], WithinAbs(23.43, 1e-9));
  REQUIRE_THAT(projected.get_point(0)[1], WithinAbs(37.58, 1e-9));

  auto unreferenced = Geometry::from_wkt("POINT (1 1)");
  REQUIRE_FALSE(unreferenced.spatial_ref().has_value());
  ScopedQuietErrors quiet;
  REQUIRE_THROWS_AS(unreferenced.transform_to(laea), OgrError);
}
