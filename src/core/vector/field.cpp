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
#include <geobind/vector/field.hpp>
#include <geobind/vector/layer.hpp>

namespace geobind {

  namespace {
    template <class... Ts>
    struct overloaded : Ts... {
      using Ts::operator()...;
    };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    std::optional<std::size_t> to_index(int index) {
      if (index < 0) return std::nullopt;
      return static_cast<std::size_t>(index);
    }
  }  // namespace

  OGRFieldType field_value_type(const FieldValue& value) {
    return std::visit(
        overloaded{
            [](std::int32_t) { return OFTInteger; },
            [](const std::vector<std::int32_t>&) { return OFTIntegerList; },
            [](std::int64_t) { return OFTInteger64; },
            [](const std::vector<std::int64_t>&) { return OFTInteger64List; },
            [](const std::string&) { return OFTString; },
            [](const std::vector<std::string>&) { return OFTStringList; },
            [](double) { return OFTReal; },
            [](const std::vector<double>&) { return OFTRealList; },
            [](const Date&) { return OFTDate; },
            [](const DateTime&) { return OFTDateTime; },
        },
        value);
  }

  std::string field_type_name(OGRFieldType type) {
    return from_c_string(OGR_GetFieldTypeName(type));
  }

  OGRFeatureDefnH Defn::c_ptr() const {
    guard_.check("Defn");
    return defn_;
  }

  std::size_t Defn::field_count() const {
    return static_cast<std::size_t>(OGR_FD_GetFieldCount(c_ptr()));
  }

  std::vector<FieldInfo> Defn::fields() const {
    OGRFeatureDefnH defn = c_ptr();
    int n = OGR_FD_GetFieldCount(defn);
    std::vector<FieldInfo> fields;
    fields.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
      OGRFieldDefnH field = OGR_FD_GetFieldDefn(defn, i);
      FieldInfo info;
      info.name = from_c_string(OGR_Fld_GetNameRef(field));
      info.type = OGR_Fld_GetType(field);
      info.width = OGR_Fld_GetWidth(field);
      info.precision = OGR_Fld_GetPrecision(field);
      info.nullable = OGR_Fld_IsNullable(field) != 0;
      if (const char* default_value = OGR_Fld_GetDefault(field)) {
        info.default_value = default_value;
      }
      fields.push_back(std::move(info));
    }
    return fields;
  }

  std::size_t Defn::geom_field_count() const {
    return static_cast<std::size_t>(OGR_FD_GetGeomFieldCount(c_ptr()));
  }

  std::vector<GeomFieldInfo> Defn::geom_fields() const {
    OGRFeatureDefnH defn = c_ptr();
    int n = OGR_FD_GetGeomFieldCount(defn);
    std::vector<GeomFieldInfo> fields;
    fields.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
      OGRGeomFieldDefnH field = OGR_FD_GetGeomFieldDefn(defn, i);
      GeomFieldInfo info;
      info.name = from_c_string(OGR_GFld_GetNameRef(field));
      info.type = OGR_GFld_GetType(field);
      if (OGRSpatialReferenceH srs = OGR_GFld_GetSpatialRef(field)) {
        info.srs = SpatialRef::from_c_obj(srs);
      }
      fields.push_back(std::move(info));
    }
    return fields;
  }

  OGRwkbGeometryType Defn::geometry_type() const {
    return OGR_FD_GetGeomType(c_ptr());
  }

  std::optional<std::size_t> Defn::field_index(std::string_view name) const {
    auto c_name = to_c_string(name);
    return to_index(OGR_FD_GetFieldIndex(c_ptr(), c_name.c_str()));
  }

  std::optional<std::size_t> Defn::geom_field_index(
      std::string_view name) const {
    auto c_name = to_c_string(name);
    return to_index(OGR_FD_GetGeomFieldIndex(c_ptr(), c_name.c_str()));
  }

  FieldDefn::FieldDefn(std::string_view name, OGRFieldType type) {
    auto c_name = to_c_string(name);
    defn_ = OGR_Fld_Create(c_name.c_str(), type);
    if (defn_ == nullptr) {
      throw detail::last_null_pointer_err("OGR_Fld_Create");
    }
  }

  FieldDefn::~FieldDefn() {
    if (defn_ != nullptr) OGR_Fld_Destroy(defn_);
  }

  FieldDefn::FieldDefn(FieldDefn&& other) noexcept
      : defn_(std::exchange(other.defn_, nullptr)) {}

  FieldDefn& FieldDefn::operator=(FieldDefn&& other) noexcept {
    if (this != &other) {
      if (defn_ != nullptr) OGR_Fld_Destroy(defn_);
      defn_ = std::exchange(other.defn_, nullptr);
    }
    return *this;
  }

  void FieldDefn::set_width(int width) { OGR_Fld_SetWidth(defn_, width); }

  void FieldDefn::set_precision(int precision) {
    OGR_Fld_SetPrecision(defn_, precision);
  }

  void FieldDefn::set_nullable(bool nullable) {
    OGR_Fld_SetNullable(defn_, nullable ? TRUE : FALSE);
  }

  void FieldDefn::set_default(std::string_view default_value) {
    auto c_default = to_c_string(default_value);
    OGR_Fld_SetDefault(defn_, c_default.c_str());
  }

  void FieldDefn::add_to_layer(const Layer& layer) const {
    OGRErr rv = OGR_L_CreateField(layer.c_ptr(), defn_, TRUE);
    if (rv != OGRERR_NONE) {
      throw OgrError(rv, "OGR_L_CreateField");
    }
  }

}  // namespace geobind
