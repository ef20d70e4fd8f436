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

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <ogr_srs_api.h>

namespace geobind {

  enum class AxisMappingStrategy {
    TraditionalGisOrder = OAMS_TRADITIONAL_GIS_ORDER,
    AuthorityCompliant = OAMS_AUTHORITY_COMPLIANT,
    Custom = OAMS_CUSTOM,
  };

  struct AreaOfUse {
    double west_lon_degree = 0;
    double south_lat_degree = 0;
    double east_lon_degree = 0;
    double north_lat_degree = 0;
    std::string name;
  };

  struct LinearUnits {
    std::string name;
    // meters per unit
    double factor = 0;
  };

  struct AngularUnits {
    std::string name;
    // radians per unit
    double factor = 0;
  };

  /**
   * @brief Owns an OGRSpatialReferenceH.
   *
   * Copies ask GDAL for a duplicate (OSRClone), they never share the native
   * object. Two references compare equal when GDAL considers them the same
   * coordinate system (OSRIsSame).
   */
  class SpatialRef {
   public:
    /** @brief An empty spatial reference. */
    SpatialRef();

    /**
     * @brief From any definition OSRSetFromUserInput accepts, eg.
     * "EPSG:4326", WKT or a PROJ string.
     */
    static SpatialRef from_definition(std::string_view definition);
    static SpatialRef from_wkt(std::string_view wkt);
    static SpatialRef from_epsg(int epsg_code);
    static SpatialRef from_proj4(std::string_view proj4_string);
    static SpatialRef from_esri(std::string_view esri_wkt);

    /** @brief Takes ownership of `srs`, NullPointerError if it is NULL. */
    static SpatialRef from_c_ptr(OGRSpatialReferenceH srs);
    /** @brief Clones `srs`, which stays owned by the caller. */
    static SpatialRef from_c_obj(OGRSpatialReferenceH srs);

    SpatialRef(const SpatialRef& other);
    SpatialRef& operator=(const SpatialRef& other);
    SpatialRef(SpatialRef&& other) noexcept;
    SpatialRef& operator=(SpatialRef&& other) noexcept;
    ~SpatialRef();

    SpatialRef clone() const;
    bool operator==(const SpatialRef& other) const;

    OGRSpatialReferenceH c_ptr() const { return srs_; }
    /** @brief Gives up ownership of the handle. */
    OGRSpatialReferenceH release();

    std::string to_wkt() const;
    std::string to_pretty_wkt() const;
    std::string to_xml() const;
    std::string to_proj4() const;
    std::string to_projjson() const;
    void morph_to_esri();

    /** @brief Authority name of the root node, eg. "EPSG". */
    std::optional<std::string> auth_name() const;
    std::optional<int> auth_code() const;
    /** @brief "AUTHORITY:CODE", eg. "EPSG:4326". */
    std::optional<std::string> authority() const;
    /** @brief Adds an EPSG authority if GDAL recognises the definition. */
    void auto_identify_epsg();
    std::optional<std::string> name() const;

    LinearUnits linear_units() const;
    AngularUnits angular_units() const;
    double semi_major() const;
    double semi_minor() const;

    bool is_geographic() const;
    bool is_projected() const;
    bool is_local() const;
    bool is_compound() const;
    bool is_geocentric() const;
    bool is_vertical() const;

    AxisMappingStrategy axis_mapping_strategy() const;
    void set_axis_mapping_strategy(AxisMappingStrategy strategy);

    std::optional<AreaOfUse> area_of_use() const;

   private:
    explicit SpatialRef(OGRSpatialReferenceH srs) : srs_(srs){};
    OGRSpatialReferenceH srs_ = nullptr;
  };

}  // namespace geobind
