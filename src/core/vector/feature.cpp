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
#include <geobind/vector/feature.hpp>
#include <geobind/vector/layer.hpp>

#include <climits>
#include <type_traits>
#include <variant>

namespace geobind {

  namespace {
    void check_ogr_err(OGRErr rv, const char* call) {
      if (rv != OGRERR_NONE) {
        throw OgrError(rv, call);
      }
    }

    template <class T, class C>
    std::vector<T> copy_list(const C* values, int count) {
      if (values == nullptr || count <= 0) return {};
      return std::vector<T>(values, values + count);
    }

    int list_size(std::size_t size) {
      if (size > static_cast<std::size_t>(INT_MAX)) {
        throw BadArgumentError("List field value is too long");
      }
      return static_cast<int>(size);
    }

    bool accepts(OGRFieldType field_type, OGRFieldType value_type) {
      if (field_type == value_type) return true;
      // widening only
      return (field_type == OFTInteger64 && value_type == OFTInteger) ||
             (field_type == OFTInteger64List && value_type == OFTIntegerList);
    }
  }  // namespace

  Feature::Feature(const Defn& defn) : feature_(OGR_F_Create(defn.c_ptr())) {
    if (feature_ == nullptr) {
      throw detail::last_null_pointer_err("OGR_F_Create");
    }
  }

  Feature Feature::from_c_ptr(OGRFeatureH feature) {
    if (feature == nullptr) {
      throw detail::last_null_pointer_err("OGRFeatureH");
    }
    return Feature(feature);
  }

  Feature::~Feature() {
    if (feature_ != nullptr) {
      epoch_.advance();
      geometry_epoch_.advance();
      OGR_F_Destroy(feature_);
    }
  }

  Feature::Feature(Feature&& other) noexcept
      : feature_(std::exchange(other.feature_, nullptr)),
        epoch_(std::move(other.epoch_)),
        geometry_epoch_(std::move(other.geometry_epoch_)) {}

  Feature& Feature::operator=(Feature&& other) noexcept {
    if (this != &other) {
      if (feature_ != nullptr) {
        epoch_.advance();
        geometry_epoch_.advance();
        OGR_F_Destroy(feature_);
      }
      feature_ = std::exchange(other.feature_, nullptr);
      epoch_ = std::move(other.epoch_);
      geometry_epoch_ = std::move(other.geometry_epoch_);
    }
    return *this;
  }

  OGRFeatureH Feature::c_ptr() const {
    if (feature_ == nullptr) {
      throw BorrowExpiredError("Feature");
    }
    return feature_;
  }

  OGRFeatureH Feature::release() {
    epoch_.advance();
    geometry_epoch_.advance();
    return std::exchange(feature_, nullptr);
  }

  Defn Feature::defn() const {
    return Defn(OGR_F_GetDefnRef(c_ptr()), epoch_.issue());
  }

  std::optional<std::uint64_t> Feature::fid() const {
    GIntBig fid = OGR_F_GetFID(c_ptr());
    if (fid < 0) return std::nullopt;
    return static_cast<std::uint64_t>(fid);
  }

  void Feature::set_fid(std::optional<std::uint64_t> fid) {
    GIntBig c_fid = fid ? static_cast<GIntBig>(*fid) : OGRNullFID;
    check_ogr_err(OGR_F_SetFID(c_ptr(), c_fid), "OGR_F_SetFID");
  }

  std::size_t Feature::field_count() const {
    return static_cast<std::size_t>(OGR_F_GetFieldCount(c_ptr()));
  }

  std::size_t Feature::geom_field_count() const {
    return static_cast<std::size_t>(OGR_F_GetGeomFieldCount(c_ptr()));
  }

  std::size_t Feature::field_index(std::string_view name) const {
    auto c_name = to_c_string(name);
    int index = OGR_F_GetFieldIndex(c_ptr(), c_name.c_str());
    if (index < 0) {
      throw InvalidFieldNameError(std::string(name), "OGR_F_GetFieldIndex");
    }
    return static_cast<std::size_t>(index);
  }

  int Feature::checked_index(std::size_t index, const char* call) const {
    if (index >= field_count()) {
      throw InvalidFieldIndexError(index, call);
    }
    return static_cast<int>(index);
  }

  std::optional<FieldValue> Feature::field(std::string_view name) const {
    return field(field_index(name));
  }

  std::optional<FieldValue> Feature::field(std::size_t index) const {
    int i = checked_index(index, "field");
    if (!OGR_F_IsFieldSetAndNotNull(c_ptr(), i)) return std::nullopt;

    OGRFieldType type = OGR_Fld_GetType(OGR_F_GetFieldDefnRef(c_ptr(), i));
    int count = 0;
    switch (type) {
      case OFTInteger:
        return FieldValue(
            static_cast<std::int32_t>(OGR_F_GetFieldAsInteger(c_ptr(), i)));
      case OFTIntegerList: {
        const int* values = OGR_F_GetFieldAsIntegerList(c_ptr(), i, &count);
        return FieldValue(copy_list<std::int32_t>(values, count));
      }
      case OFTInteger64:
        return FieldValue(
            static_cast<std::int64_t>(OGR_F_GetFieldAsInteger64(c_ptr(), i)));
      case OFTInteger64List: {
        const GIntBig* values =
            OGR_F_GetFieldAsInteger64List(c_ptr(), i, &count);
        return FieldValue(copy_list<std::int64_t>(values, count));
      }
      case OFTString:
        return FieldValue(from_c_string(OGR_F_GetFieldAsString(c_ptr(), i)));
      case OFTStringList:
        return FieldValue(string_array(OGR_F_GetFieldAsStringList(c_ptr(), i)));
      case OFTReal:
        return FieldValue(OGR_F_GetFieldAsDouble(c_ptr(), i));
      case OFTRealList: {
        const double* values = OGR_F_GetFieldAsDoubleList(c_ptr(), i, &count);
        return FieldValue(copy_list<double>(values, count));
      }
      case OFTDate:
        return FieldValue(field_as_datetime(index)->date);
      case OFTDateTime:
        return FieldValue(*field_as_datetime(index));
      default:
        throw UnhandledFieldTypeError(type, "OGR_Fld_GetType");
    }
  }

  std::optional<std::int32_t> Feature::field_as_integer(
      std::size_t index) const {
    int i = checked_index(index, "field_as_integer");
    if (!OGR_F_IsFieldSetAndNotNull(c_ptr(), i)) return std::nullopt;
    return OGR_F_GetFieldAsInteger(c_ptr(), i);
  }

  std::optional<std::int32_t> Feature::field_as_integer_by_name(
      std::string_view name) const {
    return field_as_integer(field_index(name));
  }

  std::optional<std::int64_t> Feature::field_as_integer64(
      std::size_t index) const {
    int i = checked_index(index, "field_as_integer64");
    if (!OGR_F_IsFieldSetAndNotNull(c_ptr(), i)) return std::nullopt;
    return OGR_F_GetFieldAsInteger64(c_ptr(), i);
  }

  std::optional<std::int64_t> Feature::field_as_integer64_by_name(
      std::string_view name) const {
    return field_as_integer64(field_index(name));
  }

  std::optional<double> Feature::field_as_double(std::size_t index) const {
    int i = checked_index(index, "field_as_double");
    if (!OGR_F_IsFieldSetAndNotNull(c_ptr(), i)) return std::nullopt;
    return OGR_F_GetFieldAsDouble(c_ptr(), i);
  }

  std::optional<double> Feature::field_as_double_by_name(
      std::string_view name) const {
    return field_as_double(field_index(name));
  }

  std::optional<std::string> Feature::field_as_string(
      std::size_t index) const {
    int i = checked_index(index, "field_as_string");
    if (!OGR_F_IsFieldSetAndNotNull(c_ptr(), i)) return std::nullopt;
    return from_c_string(OGR_F_GetFieldAsString(c_ptr(), i));
  }

  std::optional<std::string> Feature::field_as_string_by_name(
      std::string_view name) const {
    return field_as_string(field_index(name));
  }

  std::optional<DateTime> Feature::field_as_datetime(std::size_t index) const {
    int i = checked_index(index, "field_as_datetime");
    if (!OGR_F_IsFieldSetAndNotNull(c_ptr(), i)) return std::nullopt;
    DateTime value;
    if (!OGR_F_GetFieldAsDateTimeEx(
            c_ptr(), i, &value.date.year, &value.date.month, &value.date.day,
            &value.time.hour, &value.time.minute, &value.time.second,
            &value.time.timeZone)) {
      throw OgrError(OGRERR_FAILURE, "OGR_F_GetFieldAsDateTimeEx");
    }
    return value;
  }

  std::optional<DateTime> Feature::field_as_datetime_by_name(
      std::string_view name) const {
    return field_as_datetime(field_index(name));
  }

  void Feature::set_field_integer(std::string_view name, std::int32_t value) {
    OGR_F_SetFieldInteger(c_ptr(), static_cast<int>(field_index(name)), value);
  }

  void Feature::set_field_integer_list(
      std::string_view name, const std::vector<std::int32_t>& value) {
    std::vector<int> values(value.begin(), value.end());
    OGR_F_SetFieldIntegerList(c_ptr(), static_cast<int>(field_index(name)),
                              list_size(values.size()), values.data());
  }

  void Feature::set_field_integer64(std::string_view name,
                                    std::int64_t value) {
    OGR_F_SetFieldInteger64(c_ptr(), static_cast<int>(field_index(name)),
                            static_cast<GIntBig>(value));
  }

  void Feature::set_field_integer64_list(
      std::string_view name, const std::vector<std::int64_t>& value) {
    // GIntBig and std::int64_t may be distinct types of the same width
    std::vector<GIntBig> values(value.begin(), value.end());
    OGR_F_SetFieldInteger64List(c_ptr(), static_cast<int>(field_index(name)),
                                list_size(values.size()), values.data());
  }

  void Feature::set_field_double(std::string_view name, double value) {
    OGR_F_SetFieldDouble(c_ptr(), static_cast<int>(field_index(name)), value);
  }

  void Feature::set_field_double_list(std::string_view name,
                                      const std::vector<double>& value) {
    OGR_F_SetFieldDoubleList(c_ptr(), static_cast<int>(field_index(name)),
                             list_size(value.size()), value.data());
  }

  void Feature::set_field_string(std::string_view name,
                                 std::string_view value) {
    auto c_value = to_c_string(value);
    OGR_F_SetFieldString(c_ptr(), static_cast<int>(field_index(name)),
                         c_value.c_str());
  }

  void Feature::set_field_string_list(std::string_view name,
                                      const std::vector<std::string>& value) {
    auto list = CslStringList::from_strings(value);
    OGR_F_SetFieldStringList(c_ptr(), static_cast<int>(field_index(name)),
                             list.as_ptr());
  }

  void Feature::set_field_datetime(std::string_view name,
                                   const DateTime& value) {
    OGR_F_SetFieldDateTimeEx(c_ptr(), static_cast<int>(field_index(name)),
                             value.date.year, value.date.month, value.date.day,
                             value.time.hour, value.time.minute,
                             value.time.second, value.time.timeZone);
  }

  void Feature::set_field(std::string_view name, const FieldValue& value) {
    std::size_t index = field_index(name);
    OGRFieldType field_type = OGR_Fld_GetType(
        OGR_F_GetFieldDefnRef(c_ptr(), static_cast<int>(index)));
    OGRFieldType value_type = field_value_type(value);
    if (!accepts(field_type, value_type)) {
      throw InvalidFieldTypeError(std::string(name),
                                  field_type_name(field_type),
                                  field_type_name(value_type));
    }

    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::int32_t>) {
            set_field_integer(name, v);
          } else if constexpr (std::is_same_v<T, std::vector<std::int32_t>>) {
            set_field_integer_list(name, v);
          } else if constexpr (std::is_same_v<T, std::int64_t>) {
            set_field_integer64(name, v);
          } else if constexpr (std::is_same_v<T, std::vector<std::int64_t>>) {
            set_field_integer64_list(name, v);
          } else if constexpr (std::is_same_v<T, std::string>) {
            set_field_string(name, v);
          } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            set_field_string_list(name, v);
          } else if constexpr (std::is_same_v<T, double>) {
            set_field_double(name, v);
          } else if constexpr (std::is_same_v<T, std::vector<double>>) {
            set_field_double_list(name, v);
          } else if constexpr (std::is_same_v<T, Date>) {
            set_field_datetime(name, DateTime{v, Time{}});
          } else {
            set_field_datetime(name, v);
          }
        },
        value);
  }

  void Feature::set_field_null(std::string_view name) {
    OGR_F_SetFieldNull(c_ptr(), static_cast<int>(field_index(name)));
  }

  std::optional<Geometry> Feature::borrow_geometry(
      OGRGeometryH geometry) const {
    if (geometry == nullptr) return std::nullopt;
    return Geometry::borrowed(geometry, geometry_epoch_.issue());
  }

  std::optional<Geometry> Feature::geometry() const {
    return borrow_geometry(OGR_F_GetGeometryRef(c_ptr()));
  }

  std::optional<Geometry> Feature::geometry_by_name(
      std::string_view name) const {
    auto c_name = to_c_string(name);
    int index = OGR_F_GetGeomFieldIndex(c_ptr(), c_name.c_str());
    if (index < 0) {
      throw InvalidFieldNameError(std::string(name), "geometry_by_name");
    }
    return geometry_by_index(static_cast<std::size_t>(index));
  }

  std::optional<Geometry> Feature::geometry_by_index(std::size_t index) const {
    if (index >= geom_field_count()) {
      throw InvalidFieldIndexError(index, "geometry_by_index");
    }
    return borrow_geometry(
        OGR_F_GetGeomFieldRef(c_ptr(), static_cast<int>(index)));
  }

  Geometry Feature::geometry_or_empty() const {
    if (auto current = geometry()) {
      return current->clone();
    }
    OGRwkbGeometryType type = OGR_FD_GetGeomType(OGR_F_GetDefnRef(c_ptr()));
    if (type == wkbUnknown || type == wkbNone) {
      type = wkbGeometryCollection;
    }
    return Geometry::empty(type);
  }

  void Feature::set_geometry(const Geometry& geometry) {
    OGRFeatureH feature = c_ptr();
    // `geometry` may point into the geometry it replaces, copy it before the
    // old one is destroyed
    Geometry copy = geometry.clone();
    geometry_epoch_.advance();
    // the feature takes the copy even when the call fails
    check_ogr_err(OGR_F_SetGeometryDirectly(feature, copy.release()),
                  "OGR_F_SetGeometryDirectly");
  }

  void Feature::create(const Layer& layer) {
    check_ogr_err(OGR_L_CreateFeature(layer.c_ptr(), c_ptr()),
                  "OGR_L_CreateFeature");
  }

  void Feature::update(const Layer& layer) {
    check_ogr_err(OGR_L_SetFeature(layer.c_ptr(), c_ptr()),
                  "OGR_L_SetFeature");
  }

  std::vector<std::pair<std::string, std::optional<FieldValue>>>
  Feature::fields() const {
    std::size_t n = field_count();
    std::vector<std::pair<std::string, std::optional<FieldValue>>> result;
    result.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      OGRFieldDefnH defn = OGR_F_GetFieldDefnRef(c_ptr(), static_cast<int>(i));
      result.emplace_back(from_c_string(OGR_Fld_GetNameRef(defn)), field(i));
    }
    return result;
  }

}  // namespace geobind
