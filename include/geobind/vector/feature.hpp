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
#include <vector>

#include <ogr_api.h>

#include <geobind/common/borrow.hpp>
#include <geobind/common/common.hpp>
#include <geobind/vector/field.hpp>
#include <geobind/vector/geometry.hpp>

namespace geobind {

  class Layer;

  /**
   * @brief Owns an OGR feature.
   *
   * Features read from a layer are copies, they stay valid after the layer's
   * dataset is closed. Geometries returned by geometry() and friends are views
   * into the feature and expire when the feature is destroyed or its geometry
   * is replaced.
   */
  class Feature {
   public:
    /** @brief A new feature with the schema `defn`, all fields unset. */
    explicit Feature(const Defn& defn);
    static Feature from_c_ptr(OGRFeatureH feature);

    ~Feature();
    Feature(Feature&& other) noexcept;
    Feature& operator=(Feature&& other) noexcept;
    Feature(const Feature&) = delete;
    Feature& operator=(const Feature&) = delete;

    /** @brief The handle, BorrowExpiredError once moved from or released. */
    OGRFeatureH c_ptr() const;
    OGRFeatureH release();

    Defn defn() const;

    /** @brief Feature id, none for a feature not yet written. */
    std::optional<std::uint64_t> fid() const;
    void set_fid(std::optional<std::uint64_t> fid);

    std::size_t field_count() const;
    std::size_t geom_field_count() const;

    /** @brief Index of field `name`, InvalidFieldNameError if there is none. */
    std::size_t field_index(std::string_view name) const;

    /**
     * @brief Value of a field converted from its schema type. Unset and null
     * fields give nullopt.
     */
    std::optional<FieldValue> field(std::string_view name) const;
    std::optional<FieldValue> field(std::size_t index) const;

    std::optional<std::int32_t> field_as_integer(std::size_t index) const;
    std::optional<std::int32_t> field_as_integer_by_name(
        std::string_view name) const;
    std::optional<std::int64_t> field_as_integer64(std::size_t index) const;
    std::optional<std::int64_t> field_as_integer64_by_name(
        std::string_view name) const;
    std::optional<double> field_as_double(std::size_t index) const;
    std::optional<double> field_as_double_by_name(std::string_view name) const;
    std::optional<std::string> field_as_string(std::size_t index) const;
    std::optional<std::string> field_as_string_by_name(
        std::string_view name) const;
    std::optional<DateTime> field_as_datetime(std::size_t index) const;
    std::optional<DateTime> field_as_datetime_by_name(
        std::string_view name) const;

    // Setters convert to the field's schema type the way OGR does.
    void set_field_integer(std::string_view name, std::int32_t value);
    void set_field_integer_list(std::string_view name,
                                const std::vector<std::int32_t>& value);
    void set_field_integer64(std::string_view name, std::int64_t value);
    void set_field_integer64_list(std::string_view name,
                                  const std::vector<std::int64_t>& value);
    void set_field_double(std::string_view name, double value);
    void set_field_double_list(std::string_view name,
                               const std::vector<double>& value);
    void set_field_string(std::string_view name, std::string_view value);
    void set_field_string_list(std::string_view name,
                               const std::vector<std::string>& value);
    void set_field_datetime(std::string_view name, const DateTime& value);

    /**
     * @brief Sets field `name` to `value`. The value's type must match the
     * field's schema type, otherwise InvalidFieldTypeError. An integer may be
     * stored in an Integer64 field.
     */
    void set_field(std::string_view name, const FieldValue& value);
    void set_field_null(std::string_view name);

    /** @brief The default geometry, nullopt if it is unset. */
    std::optional<Geometry> geometry() const;
    std::optional<Geometry> geometry_by_name(std::string_view name) const;
    std::optional<Geometry> geometry_by_index(std::size_t index) const;

    /**
     * @brief An owned copy of the default geometry, or an empty geometry of
     * the schema's geometry type when it is unset.
     */
    Geometry geometry_or_empty() const;

    /** @brief Replaces the default geometry with a copy of `geometry`. */
    void set_geometry(const Geometry& geometry);

    /** @brief Writes the feature to `layer` as a new feature. */
    void create(const Layer& layer);
    /** @brief Rewrites the feature with the same fid in `layer`. */
    void update(const Layer& layer);

    /** @brief Every field as (name, value). */
    std::vector<std::pair<std::string, std::optional<FieldValue>>> fields()
        const;

   private:
    explicit Feature(OGRFeatureH feature) : feature_(feature){};
    int checked_index(std::size_t index, const char* call) const;
    std::optional<Geometry> borrow_geometry(OGRGeometryH geometry) const;

    OGRFeatureH feature_ = nullptr;
    // views of the feature itself, eg. its Defn
    Epoch epoch_;
    // views of the current geometries
    Epoch geometry_epoch_;
  };

}  // namespace geobind
