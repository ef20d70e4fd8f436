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
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <ogr_api.h>

#include <geobind/common/borrow.hpp>
#include <geobind/common/common.hpp>
#include <geobind/srs/spatial_ref.hpp>

namespace geobind {

  class Layer;

  typedef std::variant<std::int32_t, std::vector<std::int32_t>, std::int64_t,
                       std::vector<std::int64_t>, std::string,
                       std::vector<std::string>, double, std::vector<double>,
                       Date, DateTime>
      FieldValue;

  /** @brief The OGR field type a value is stored as, eg. OFTInteger64. */
  OGRFieldType field_value_type(const FieldValue& value);
  /** @brief OGR's name of a field type, eg. "Integer64". */
  std::string field_type_name(OGRFieldType type);

  struct FieldInfo {
    std::string name;
    OGRFieldType type = OFTString;
    int width = 0;
    int precision = 0;
    bool nullable = true;
    std::optional<std::string> default_value;
  };

  struct GeomFieldInfo {
    std::string name;
    OGRwkbGeometryType type = wkbUnknown;
    std::optional<SpatialRef> srs;
  };

  /** @brief Schema of the features of a layer. A view. */
  class Defn {
   public:
    Defn(OGRFeatureDefnH defn, BorrowGuard guard)
        : defn_(defn), guard_(std::move(guard)){};

    OGRFeatureDefnH c_ptr() const;

    std::size_t field_count() const;
    std::vector<FieldInfo> fields() const;
    std::size_t geom_field_count() const;
    std::vector<GeomFieldInfo> geom_fields() const;
    /** @brief Type of the default geometry field. */
    OGRwkbGeometryType geometry_type() const;

    std::optional<std::size_t> field_index(std::string_view name) const;
    std::optional<std::size_t> geom_field_index(std::string_view name) const;

   private:
    OGRFeatureDefnH defn_;
    BorrowGuard guard_;
  };

  /** @brief Owns the definition of a field that is yet to be created. */
  class FieldDefn {
   public:
    FieldDefn(std::string_view name, OGRFieldType type);
    ~FieldDefn();
    FieldDefn(FieldDefn&& other) noexcept;
    FieldDefn& operator=(FieldDefn&& other) noexcept;
    FieldDefn(const FieldDefn&) = delete;
    FieldDefn& operator=(const FieldDefn&) = delete;

    OGRFieldDefnH c_ptr() const { return defn_; }

    void set_width(int width);
    void set_precision(int precision);
    void set_nullable(bool nullable);
    /** @brief Default as an SQL literal, eg. "'text'" or "CURRENT_TIMESTAMP". */
    void set_default(std::string_view default_value);

    /** @brief Adds the field to the schema of `layer`. */
    void add_to_layer(const Layer& layer) const;

   private:
    OGRFieldDefnH defn_ = nullptr;
  };

}  // namespace geobind
