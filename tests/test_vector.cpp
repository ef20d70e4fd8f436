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
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace geobind;

namespace {
  std::span<const std::uint8_t> as_bytes(std::string_view text) {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
  }

  /** @brief The points fixture as an in-memory GeoJSON file. */
  struct PointsFile {
    PointsFile() { create_mem_file(path, as_bytes(test::points_geojson())); }
    ~PointsFile() { unlink_mem_file(path); }
    std::string path = "/vsimem/geobind_points.geojson";
  };

  Dataset create_gpkg(const std::string& path) {
    auto dataset = Driver::get_by_name("GPKG").create_vector_only(path);
    auto srs = SpatialRef::from_epsg(28992);
    LayerOptions options;
    options.name = "buildings";
    options.srs = &srs;
    options.ty = wkbPolygon;
    auto layer = dataset.create_layer(options);
    layer.create_defn_fields({{"height", OFTReal},
                              {"name", OFTString},
                              {"levels", OFTInteger64}});
    return dataset;
  }
}  // namespace

TEST_CASE("read features of a GeoJSON layer") {
  PointsFile file;
  auto dataset = Dataset::open(file.path);
  REQUIRE(dataset.layer_count() == 1);
  auto layer = dataset.layer(0);
  REQUIRE(dataset.layer_by_name(layer.name()).name() == layer.name());
  REQUIRE(layer.feature_count() == 3);

  SECTION("iterate") {
    std::vector<std::string> names;
    for (auto& feature : layer.features()) {
      names.push_back(*feature.field_as_string_by_name("name"));
    }
    REQUIRE(names == std::vector<std::string>{"a", "b", "c"});

    // a second range starts from the first feature again
    std::size_t count = 0;
    for (auto& feature : layer.features()) {
      REQUIRE(feature.geometry().has_value());
      ++count;
    }
    REQUIRE(count == 3);
  }

  SECTION("iterator outlives its range") {
    auto it = layer.features().begin();
    REQUIRE(it->field_as_string_by_name("name") == "a");
    ++it;
    REQUIRE((*it).field_as_string_by_name("name") == "b");
    ++it;
    ++it;
    REQUIRE(it == FeatureIterator());
  }

  SECTION("field values") {
    auto feature = layer.next_feature();
    REQUIRE(feature.has_value());
    REQUIRE(feature->field_count() == 2);
    REQUIRE(feature->field("id") == FieldValue(std::int32_t{1}));
    REQUIRE(feature->field_as_integer64_by_name("id") == 1);
    REQUIRE(feature->field_as_double_by_name("id") == 1.0);
    REQUIRE(feature->field_as_string(1) == "a");
    REQUIRE_THROWS_AS(feature->field("missing"), InvalidFieldNameError);
    REQUIRE_THROWS_AS(feature->field(std::size_t{7}), InvalidFieldIndexError);

    auto fields = feature->fields();
    REQUIRE(fields.size() == 2);
    REQUIRE(fields[1].first == "name");
    REQUIRE(fields[1].second == FieldValue(std::string("a")));
  }

  SECTION("schema") {
    auto defn = layer.defn();
    auto fields = defn.fields();
    REQUIRE(fields.size() == 2);
    REQUIRE(fields[0].name == "id");
    REQUIRE(fields[0].type == OFTInteger);
    REQUIRE(defn.field_index("name") == 1);
    REQUIRE_FALSE(defn.field_index("missing").has_value());
    REQUIRE(defn.geometry_type() == wkbPoint);
    REQUIRE(defn.geom_field_count() == 1);
  }

  SECTION("spatial filter") {
    layer.set_spatial_filter_rect(0, 0, 5, 5);
    REQUIRE(layer.feature_count() == 2);
    auto area = Geometry::bbox(9, 9, 11, 11);
    layer.set_spatial_filter(area);
    REQUIRE(layer.feature_count() == 1);
    layer.clear_spatial_filter();
    REQUIRE(layer.feature_count() == 3);
  }

  SECTION("attribute filter") {
    layer.set_attribute_filter("name = 'c'");
    auto feature = layer.next_feature();
    REQUIRE(feature.has_value());
    REQUIRE(feature->field_as_integer_by_name("id") == 3);
    REQUIRE_FALSE(layer.next_feature().has_value());
    layer.clear_attribute_filter();
    REQUIRE(layer.feature_count() == 3);

    ScopedQuietErrors quiet;
    REQUIRE_THROWS_AS(layer.set_attribute_filter("name = = 'c'"), OgrError);
  }

  SECTION("extent") {
    auto extent = layer.extent();
    REQUIRE(extent.has_value());
    REQUIRE(*extent == Envelope{1, 10, 1, 10});
    REQUIRE(fmt::format("{}", extent) == "[1,1,10,10]");
  }

  SECTION("spatial reference") {
    auto srs = layer.spatial_ref();
    REQUIRE(srs.has_value());
    REQUIRE(srs->is_geographic());
  }

  SECTION("sql") {
    auto query = fmt::format("SELECT name FROM \"{}\" WHERE id > 1",
                             layer.name());
    auto result = dataset.execute_sql(query, nullptr, SqlDialect::Ogr);
    REQUIRE(result.has_value());
    auto result_layer = result->layer();
    REQUIRE(result_layer.feature_count() == 2);
    auto feature = result_layer.next_feature();
    REQUIRE(feature->field_as_string(0) == "b");

    result.reset();
    REQUIRE_THROWS_AS(result_layer.feature_count(), BorrowExpiredError);

    ScopedQuietErrors quiet;
    REQUIRE_THROWS_AS(dataset.execute_sql("SELECT FROM WHERE"), NativeError);
  }

  SECTION("views expire with the dataset") {
    dataset.close();
    REQUIRE_THROWS_AS(layer.name(), BorrowExpiredError);
  }
}

TEST_CASE("geometry views of a feature") {
  PointsFile file;
  auto dataset = Dataset::open(file.path);
  auto layer = dataset.layer(0);

  std::optional<Geometry> view;
  {
    auto feature = layer.next_feature();
    view = feature->geometry();
    REQUIRE(view->get_point(0) == arr3d{1, 1, 0});
    REQUIRE_FALSE(view->is_owned());
    REQUIRE_THROWS_AS(view->release(), BadArgumentError);

    auto owned = feature->geometry_or_empty();
    REQUIRE(owned.is_owned());
    feature->set_geometry(Geometry::from_wkt("POINT (5 5)"));
    REQUIRE_THROWS_AS(view->wkt(), BorrowExpiredError);
    REQUIRE(owned.wkt() == "POINT (1 1)");

    view = feature->geometry();
    REQUIRE(view->wkt() == "POINT (5 5)");
  }
  REQUIRE_THROWS_AS(view->wkt(), BorrowExpiredError);
}

TEST_CASE("write features to a GeoPackage") {
  test::TempDir tmp;
  auto path = tmp.file("buildings.gpkg");
  auto dataset = create_gpkg(path);
  auto layer = dataset.layer_by_name("buildings");

  layer.create_feature_fields(
      Geometry::bbox(0, 0, 2, 1), {"height", "name", "levels"},
      {FieldValue(12.5), FieldValue(std::string("town hall")),
       FieldValue(std::int64_t{3})});
  REQUIRE(layer.feature_count() == 1);

  SECTION("read back") {
    auto feature = layer.feature(1);
    REQUIRE(feature.has_value());
    REQUIRE(feature->fid() == 1);
    REQUIRE(feature->field_as_double_by_name("height") == 12.5);
    REQUIRE(feature->field_as_string_by_name("name") == "town hall");
    REQUIRE(feature->field("levels") == FieldValue(std::int64_t{3}));
    REQUIRE_THAT(feature->geometry()->area(),
                 Catch::Matchers::WithinAbs(2.0, 1e-12));
    REQUIRE(layer.extent() == Envelope{0, 2, 0, 1});
    REQUIRE(layer.spatial_ref()->auth_code() == 28992);
    REQUIRE_FALSE(layer.feature(42).has_value());
  }

  SECTION("field values are checked against the schema") {
    Feature feature(layer.defn());
    REQUIRE_THROWS_AS(feature.set_field("name", FieldValue(std::int32_t{1})),
                      InvalidFieldTypeError);
    try {
      feature.set_field("height", FieldValue(std::string("high")));
    } catch (const InvalidFieldTypeError& e) {
      REQUIRE(e.field() == "height");
      REQUIRE(e.expected() == "Real");
      REQUIRE(e.actual() == "String");
    }
    // 32 bit integers widen to 64 bit fields
    feature.set_field("levels", FieldValue(std::int32_t{4}));
    REQUIRE(feature.field_as_integer64_by_name("levels") == 4);

    REQUIRE_THROWS_AS(feature.set_field("missing", FieldValue(1.0)),
                      InvalidFieldNameError);
    REQUIRE_THROWS_AS(
        layer.create_feature_fields(Geometry::bbox(0, 0, 1, 1), {"height"},
                                    {}),
        BadArgumentError);
  }

  SECTION("null fields and empty geometries") {
    Feature feature(layer.defn());
    feature.set_field_string("name", "shed");
    feature.set_field_null("name");
    REQUIRE_FALSE(feature.field("name").has_value());
    REQUIRE_FALSE(feature.geometry().has_value());
    auto empty = feature.geometry_or_empty();
    REQUIRE(empty.is_empty());
    REQUIRE(empty.geometry_type() == wkbPolygon);
  }

  SECTION("update a feature") {
    auto feature = layer.feature(1);
    feature->set_field_double("height", 20.0);
    feature->update(layer);
    REQUIRE(layer.feature(1)->field_as_double_by_name("height") == 20.0);
  }

  SECTION("add a field") {
    FieldDefn code("code", OFTString);
    code.set_width(8);
    code.set_nullable(false);
    code.set_default("'x'");
    code.add_to_layer(layer);
    auto fields = layer.defn().fields();
    REQUIRE(fields.size() == 4);
    REQUIRE(fields[3].name == "code");
    REQUIRE(fields[3].width == 8);
    REQUIRE_FALSE(fields[3].nullable);
  }

  SECTION("sql without a result set") {
    auto result = dataset.execute_sql("DELETE FROM buildings WHERE fid = 1");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(layer.feature_count() == 0);
  }

  SECTION("sqlite dialect") {
    auto result = dataset.execute_sql("SELECT COUNT(*) FROM buildings",
                                      nullptr, SqlDialect::Sqlite);
    REQUIRE(result.has_value());
    auto feature = result->layer().next_feature();
    REQUIRE(feature->field_as_integer64(0) == 1);
  }

  SECTION("capabilities") {
    REQUIRE(layer.test_capability(OLCSequentialWrite));
    REQUIRE(layer.test_capability(OLCRandomRead));
    REQUIRE_FALSE(layer.test_capability("NotACapability"));
  }
}

TEST_CASE("transactions") {
  test::TempDir tmp;
  auto dataset = create_gpkg(tmp.file("transactions.gpkg"));
  auto layer = dataset.layer(0);

  SECTION("commit") {
    auto transaction = dataset.start_transaction();
    REQUIRE(transaction.is_active());
    layer.create_feature(Geometry::bbox(0, 0, 1, 1));
    transaction.commit();
    REQUIRE_FALSE(transaction.is_active());
    REQUIRE(layer.feature_count() == 1);
    REQUIRE_THROWS_AS(transaction.commit(), BadArgumentError);
  }

  SECTION("explicit rollback") {
    auto transaction = dataset.start_transaction();
    layer.create_feature(Geometry::bbox(0, 0, 1, 1));
    transaction.rollback();
    REQUIRE(layer.feature_count() == 0);
  }

  SECTION("implicit rollback") {
    {
      auto transaction = dataset.start_transaction();
      layer.create_feature(Geometry::bbox(0, 0, 1, 1));
    }
    REQUIRE(layer.feature_count() == 0);
  }
}

TEST_CASE("features independent of a layer") {
  PointsFile file;
  auto dataset = Dataset::open(file.path);
  auto feature = dataset.layer(0).next_feature();
  auto defn = feature->defn();
  dataset.close();

  // fetched features own their schema reference
  REQUIRE(feature->field_as_string_by_name("name") == "a");
  REQUIRE(defn.field_count() == 2);

  OGRFeatureH handle = feature->release();
  REQUIRE_THROWS_AS(defn.field_count(), BorrowExpiredError);
  auto adopted = Feature::from_c_ptr(handle);
  REQUIRE(adopted.field_as_integer_by_name("id") == 1);
}

TEST_CASE("replace a geometry with a part of itself") {
  test::TempDir tmp;
  auto dataset = create_gpkg(tmp.file("buildings.gpkg"));
  Feature feature(dataset.layer(0).defn());
  feature.set_geometry(Geometry::bbox(0, 0, 2, 2));

  auto polygon = feature.geometry();
  auto ring = polygon->get_geometry(0);
  feature.set_geometry(ring);
  REQUIRE_THROWS_AS(ring.wkt(), BorrowExpiredError);
  REQUIRE_THROWS_AS(polygon->wkt(), BorrowExpiredError);

  auto current = feature.geometry();
  REQUIRE(wkbFlatten(current->geometry_type()) == wkbLineString);
  REQUIRE(current->point_count() == 5);
  REQUIRE(current->envelope().max_x == 2);
}

TEST_CASE("moved-from features") {
  PointsFile file;
  auto dataset = Dataset::open(file.path);
  auto feature = *dataset.layer(0).next_feature();
  Feature moved = std::move(feature);
  REQUIRE(moved.field_count() == 2);
  REQUIRE_THROWS_AS(feature.c_ptr(), BorrowExpiredError);
  REQUIRE_THROWS_AS(feature.field_count(), BorrowExpiredError);
  REQUIRE_THROWS_AS(feature.geometry(), BorrowExpiredError);
  REQUIRE_THROWS_AS(feature.set_geometry(Geometry::from_wkt("POINT (0 0)")),
                    BorrowExpiredError);
}
