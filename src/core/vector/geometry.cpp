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


#include <geobind/common/cpl_string.hpp>
#include <geobind/common/errors.hpp>
#include <geobind/srs/coord_transform.hpp>
#include <geobind/srs/spatial_ref.hpp>
#include <geobind/vector/geometry.hpp>

#include <fmt/format.h>

#include <climits>

namespace geobind {

  namespace {
    void check_ogr_err(OGRErr rv, const char* call) {
      if (rv != OGRERR_NONE) {
        throw OgrError(rv, call);
      }
    }

    int to_point_index(std::size_t index, std::size_t count) {
      if (index >= count) {
        throw BadArgumentError(fmt::format(
            "Point index {} out of range, geometry has {} points", index,
            count));
      }
      return static_cast<int>(index);
    }
  }  // namespace

  Geometry Geometry::empty(OGRwkbGeometryType type) {
    OGRGeometryH geometry = OGR_G_CreateGeometry(type);
    if (geometry == nullptr) {
      throw detail::last_null_pointer_err("OGR_G_CreateGeometry");
    }
    return Geometry(Owned{geometry});
  }

  Geometry Geometry::from_wkt(std::string_view wkt) {
    std::string c_wkt = to_c_string(wkt);
    // OGR advances the pointer past the parsed text
    char* cursor = c_wkt.data();
    OGRGeometryH geometry = nullptr;
    OGRErr rv = OGR_G_CreateFromWkt(&cursor, nullptr, &geometry);
    check_ogr_err(rv, "OGR_G_CreateFromWkt");
    return from_c_ptr(geometry);
  }

  Geometry Geometry::from_wkb(std::span<const std::uint8_t> wkb) {
    if (wkb.size() > static_cast<std::size_t>(INT_MAX)) {
      throw BadArgumentError(
          fmt::format("WKB of {} bytes is too large", wkb.size()));
    }
    OGRGeometryH geometry = nullptr;
    OGRErr rv = OGR_G_CreateFromWkb(const_cast<std::uint8_t*>(wkb.data()),
                                    nullptr, &geometry,
                                    static_cast<int>(wkb.size()));
    check_ogr_err(rv, "OGR_G_CreateFromWkb");
    return from_c_ptr(geometry);
  }

  Geometry Geometry::from_geojson(std::string_view json) {
    auto c_json = to_c_string(json);
    OGRGeometryH geometry = OGR_G_CreateGeometryFromJson(c_json.c_str());
    if (geometry == nullptr) {
      throw detail::last_null_pointer_err("OGR_G_CreateGeometryFromJson");
    }
    return Geometry(Owned{geometry});
  }

  Geometry Geometry::bbox(double min_x, double min_y, double max_x,
                          double max_y) {
    Geometry ring = empty(wkbLinearRing);
    ring.add_point_2d({min_x, min_y});
    ring.add_point_2d({max_x, min_y});
    ring.add_point_2d({max_x, max_y});
    ring.add_point_2d({min_x, max_y});
    ring.add_point_2d({min_x, min_y});
    Geometry polygon = empty(wkbPolygon);
    polygon.add_geometry(std::move(ring));
    return polygon;
  }

  Geometry Geometry::from_c_ptr(OGRGeometryH geometry) {
    if (geometry == nullptr) {
      throw detail::last_null_pointer_err("OGRGeometryH");
    }
    return Geometry(Owned{geometry});
  }

  Geometry Geometry::borrowed(OGRGeometryH geometry, BorrowGuard guard) {
    if (geometry == nullptr) {
      throw detail::last_null_pointer_err("OGRGeometryH");
    }
    return Geometry(Borrowed{geometry, std::move(guard)});
  }

  Geometry::Geometry(Geometry&& other) noexcept
      : ref_(std::exchange(other.ref_, Owned{})),
        epoch_(std::move(other.epoch_)) {}

  Geometry& Geometry::operator=(Geometry&& other) noexcept {
    if (this != &other) {
      destroy();
      ref_ = std::exchange(other.ref_, Owned{});
      epoch_ = std::move(other.epoch_);
    }
    return *this;
  }

  Geometry::~Geometry() { destroy(); }

  void Geometry::destroy() noexcept {
    if (auto* owned = std::get_if<Owned>(&ref_)) {
      if (owned->handle != nullptr) {
        epoch_.advance();
        OGR_G_DestroyGeometry(owned->handle);
        owned->handle = nullptr;
      }
    }
  }

  OGRGeometryH Geometry::c_ptr() const {
    if (const auto* borrowed = std::get_if<Borrowed>(&ref_)) {
      borrowed->guard.check("Geometry");
      return borrowed->handle;
    }
    OGRGeometryH handle = std::get<Owned>(ref_).handle;
    if (handle == nullptr) {
      throw BorrowExpiredError("Geometry");
    }
    return handle;
  }

  OGRGeometryH Geometry::release() {
    auto* owned = std::get_if<Owned>(&ref_);
    if (owned == nullptr) {
      throw BadArgumentError("Cannot release a borrowed geometry");
    }
    epoch_.advance();
    return std::exchange(owned->handle, nullptr);
  }

  Geometry Geometry::clone() const {
    OGRGeometryH cloned = OGR_G_Clone(c_ptr());
    if (cloned == nullptr) {
      throw detail::last_null_pointer_err("OGR_G_Clone");
    }
    return Geometry(Owned{cloned});
  }

  std::string Geometry::wkt() const {
    char* wkt = nullptr;
    OGRErr rv = OGR_G_ExportToWkt(c_ptr(), &wkt);
    std::string result = take_cpl_string(wkt);
    check_ogr_err(rv, "OGR_G_ExportToWkt");
    return result;
  }

  std::vector<std::uint8_t> Geometry::wkb() const {
    OGRGeometryH geometry = c_ptr();
    int size = OGR_G_WkbSize(geometry);
    std::vector<std::uint8_t> wkb(static_cast<std::size_t>(size));
    check_ogr_err(OGR_G_ExportToWkb(geometry, wkbNDR, wkb.data()),
                  "OGR_G_ExportToWkb");
    return wkb;
  }

  std::string Geometry::json() const {
    char* json = OGR_G_ExportToJson(c_ptr());
    if (json == nullptr) {
      throw detail::last_null_pointer_err("OGR_G_ExportToJson");
    }
    return take_cpl_string(json);
  }

  OGRwkbGeometryType Geometry::geometry_type() const {
    return OGR_G_GetGeometryType(c_ptr());
  }

  std::string Geometry::geometry_name() const {
    return from_c_string(OGR_G_GetGeometryName(c_ptr()));
  }

  std::size_t Geometry::geometry_count() const {
    return static_cast<std::size_t>(OGR_G_GetGeometryCount(c_ptr()));
  }

  std::size_t Geometry::point_count() const {
    return static_cast<std::size_t>(OGR_G_GetPointCount(c_ptr()));
  }

  arr3d Geometry::get_point(std::size_t index) const {
    arr3d point{};
    OGR_G_GetPoint(c_ptr(), to_point_index(index, point_count()), &point[0],
                   &point[1], &point[2]);
    return point;
  }

  vec3d Geometry::get_point_vec() const {
    std::size_t n = point_count();
    vec3d points;
    points.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      points.push_back(get_point(i));
    }
    return points;
  }

  void Geometry::set_point(std::size_t index, const arr3d& point) {
    // OGR grows the point array when setting one past the end
    OGR_G_SetPoint(c_ptr(), to_point_index(index, point_count() + 1),
                   point[0], point[1], point[2]);
  }

  void Geometry::set_point_2d(std::size_t index, const arr2d& point) {
    OGR_G_SetPoint_2D(c_ptr(), to_point_index(index, point_count() + 1),
                      point[0], point[1]);
  }

  void Geometry::add_point(const arr3d& point) {
    OGR_G_AddPoint(c_ptr(), point[0], point[1], point[2]);
  }

  void Geometry::add_point_2d(const arr2d& point) {
    OGR_G_AddPoint_2D(c_ptr(), point[0], point[1]);
  }

  void Geometry::add_geometry(Geometry sub) {
    check_ogr_err(OGR_G_AddGeometry(c_ptr(), sub.c_ptr()),
                  "OGR_G_AddGeometry");
  }

  Geometry Geometry::get_geometry(std::size_t index) const {
    std::size_t count = geometry_count();
    if (index >= count) {
      throw BadArgumentError(fmt::format(
          "Sub-geometry index {} out of range, geometry has {}", index,
          count));
    }
    OGRGeometryH sub = OGR_G_GetGeometryRef(c_ptr(), static_cast<int>(index));
    if (sub == nullptr) {
      throw detail::last_null_pointer_err("OGR_G_GetGeometryRef");
    }
    // a sub-geometry lives as long as the outermost owner
    if (const auto* borrowed = std::get_if<Borrowed>(&ref_)) {
      return Geometry(Borrowed{sub, borrowed->guard});
    }
    return Geometry(Borrowed{sub, epoch_.issue()});
  }

  double Geometry::area() const { return OGR_G_Area(c_ptr()); }

  double Geometry::length() const { return OGR_G_Length(c_ptr()); }

  Envelope Geometry::envelope() const {
    OGREnvelope env;
    OGR_G_GetEnvelope(c_ptr(), &env);
    return {env.MinX, env.MaxX, env.MinY, env.MaxY};
  }

  Envelope3D Geometry::envelope_3d() const {
    OGREnvelope3D env;
    OGR_G_GetEnvelope3D(c_ptr(), &env);
    return {env.MinX, env.MaxX, env.MinY, env.MaxY, env.MinZ, env.MaxZ};
  }

  bool Geometry::is_empty() const { return OGR_G_IsEmpty(c_ptr()) != 0; }

  Geometry Geometry::transform(const CoordTransform& transformation) const {
    Geometry result = clone();
    result.transform_inplace(transformation);
    return result;
  }

  void Geometry::transform_inplace(const CoordTransform& transformation) {
    check_ogr_err(OGR_G_Transform(c_ptr(), transformation.c_ptr()),
                  "OGR_G_Transform");
  }

  Geometry Geometry::transform_to(const SpatialRef& srs) const {
    Geometry result = clone();
    result.transform_to_inplace(srs);
    return result;
  }

  void Geometry::transform_to_inplace(const SpatialRef& srs) {
    check_ogr_err(OGR_G_TransformTo(c_ptr(), srs.c_ptr()),
                  "OGR_G_TransformTo");
  }

  std::optional<SpatialRef> Geometry::spatial_ref() const {
    OGRSpatialReferenceH srs = OGR_G_GetSpatialReference(c_ptr());
    if (srs == nullptr) return std::nullopt;
    return SpatialRef::from_c_obj(srs);
  }

  void Geometry::set_spatial_ref(const SpatialRef& srs) {
    // reference counted by OGR, the caller keeps its copy
    OGR_G_AssignSpatialReference(c_ptr(), srs.c_ptr());
  }

  bool Geometry::operator==(const Geometry& other) const {
    return OGR_G_Equals(c_ptr(), other.c_ptr()) != 0;
  }

}  // namespace geobind
