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
#include <string>
#include <vector>

using namespace geobind;

TEST_CASE("dataset metadata") {
  auto dataset = Driver::get_by_name("MEM").create("", 2, 2, 1);

  dataset.set_metadata_item("AREA_OR_POINT", "Point");
  dataset.set_metadata_item("SOURCE", "survey", "GEOBIND");
  REQUIRE(dataset.metadata_item("AREA_OR_POINT", "") == "Point");
  REQUIRE(dataset.metadata_item("SOURCE", "GEOBIND") == "survey");
  REQUIRE_FALSE(dataset.metadata_item("SOURCE", "").has_value());

  auto domains = dataset.metadata_domains();
  REQUIRE(std::find(domains.begin(), domains.end(), "GEOBIND") !=
          domains.end());

  auto items = dataset.metadata_domain("GEOBIND");
  REQUIRE(items.has_value());
  REQUIRE(*items == std::vector<std::string>{"SOURCE=survey"});
  REQUIRE_FALSE(dataset.metadata_domain("NOT_A_DOMAIN").has_value());

  auto entries = dataset.metadata();
  REQUIRE(std::find(entries.begin(), entries.end(),
                    MetadataEntry{"GEOBIND", "SOURCE", "survey"}) !=
          entries.end());
}

TEST_CASE("band and driver metadata") {
  auto dataset = Driver::get_by_name("MEM").create("", 2, 2, 1);
  auto band = dataset.rasterband(1);
  band.set_description("elevation");
  REQUIRE(band.description() == "elevation");
  band.set_metadata_item("STATISTICS_MAXIMUM", "42");
  REQUIRE(band.metadata_item("STATISTICS_MAXIMUM", "") == "42");

  auto gtiff = Driver::get_by_name("GTiff");
  REQUIRE(gtiff.description() == "GTiff");
  REQUIRE(gtiff.metadata_item(GDAL_DMD_EXTENSIONS, "").has_value());
  REQUIRE(gtiff.metadata_item(GDAL_DCAP_RASTER, "") == "YES");

  REQUIRE_THROWS_AS(band.set_metadata_item(std::string("A\0", 2), "1"),
                    StringConversionError);
}
