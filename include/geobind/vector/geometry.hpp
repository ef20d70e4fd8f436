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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <ogr_api.h>

#include <geobind/common/borrow.hpp>
#include <geobind/common/common.hpp>

namespace geobind {

  class CoordTransform;
  class SpatialRef;

  /**
   * @brief An OGR geometry that is either owned or borrowed.
   *
   * Owned geometries come from the factories, clone() and the transform
   * functions, and are destroyed with the wrapper. Borrowed geometries point
   * into a Feature (or into a parent geometry) and throw BorrowExpiredError
   * once that owner is gone or replaced its geometry.
   *
   * Sub-geometries returned by get_geometry() are always borrowed from this
   * geometry.
   */
  class Geometry {
   public:
    /** @brief An empty geometry of `type`, eg. wkbLineString. */
    static Geometry empty(OGRwkbGeometryType type);
    static Geometry from_wkt(std::string_view wkt);
    static Geometry from_wkb(std::span<const std::uint8_t> wkb);
    static Geometry from_geojson(std::string_view json);
    /** @brief A closed polygon covering the rectangle. */
    static Geometry bbox(double min_x, double min_y, double max_x,
                         double max_y);

    /** @brief Takes ownership of `geometry`, NullPointerError if NULL. */
    static Geometry from_c_ptr(OGRGeometryH geometry);
    /** @brief A view of `geometry`, valid while `guard` is alive. */
    static Geometry borrowed(OGRGeometryH geometry, BorrowGuard guard);

    Geometry(Geometry&& other) noexcept;
    Geometry& operator=(Geometry&& other) noexcept;
    Geometry(const Geometry&) = delete;
    Geometry& operator=(const Geometry&) = delete;
    ~Geometry();

    bool is_owned() const { return std::holds_alternative<Owned>(ref_); }

    OGRGeometryH c_ptr() const;
    /**
     * @brief Gives up ownership of the handle. BadArgumentError for a
     * borrowed geometry, the caller cannot take what this wrapper never
     * owned.
     */
    OGRGeometryH release();

    /** @brief An owned deep copy. */
    Geometry clone() const;

    std::string wkt() const;
    /** @brief Little endian WKB. */
    std::vector<std::uint8_t> wkb() const;
    std::string json() const;

    OGRwkbGeometryType geometry_type() const;
    std::string geometry_name() const;
    std::size_t geometry_count() const;
    std::size_t point_count() const;

    /** @brief Point `index` as (x, y, z). */
    arr3d get_point(std::size_t index) const;
    vec3d get_point_vec() const;
    void set_point(std::size_t index, const arr3d& point);
    void set_point_2d(std::size_t index, const arr2d& point);
    void add_point(const arr3d& point);
    void add_point_2d(const arr2d& point);

    /**
     * @brief Adds `sub` to this collection or polygon. `sub` is consumed,
     * GDAL keeps its own copy.
     */
    void add_geometry(Geometry sub);
    /** @brief Sub-geometry `index`, borrowed from this geometry. */
    Geometry get_geometry(std::size_t index) const;

    double area() const;
    double length() const;
    Envelope envelope() const;
    Envelope3D envelope_3d() const;
    bool is_empty() const;

    /** @brief A transformed owned copy. */
    Geometry transform(const CoordTransform& transformation) const;
    void transform_inplace(const CoordTransform& transformation);
    /** @brief A copy in `srs`. The geometry needs a spatial reference. */
    Geometry transform_to(const SpatialRef& srs) const;
    void transform_to_inplace(const SpatialRef& srs);

    std::optional<SpatialRef> spatial_ref() const;
    void set_spatial_ref(const SpatialRef& srs);

    /** @brief Geometric equality (OGR_G_Equals). */
    bool operator==(const Geometry& other) const;

   private:
    struct Owned {
      OGRGeometryH handle = nullptr;
    };
    struct Borrowed {
      OGRGeometryH handle = nullptr;
      BorrowGuard guard;
    };

    explicit Geometry(Owned owned) : ref_(owned){};
    explicit Geometry(Borrowed borrowed) : ref_(std::move(borrowed)){};
    void destroy() noexcept;

    std::variant<Owned, Borrowed> ref_;
    // invalidates sub-geometry views when an owned geometry is destroyed
    Epoch epoch_;
  };

}  // namespace geobind
