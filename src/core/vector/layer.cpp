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
#include <geobind/vector/layer.hpp>

#include <fmt/format.h>

namespace geobind {

  OGRLayerH Layer::c_ptr() const {
    guard_.check("Layer");
    if (dataset_guard_) dataset_guard_->check("Layer");
    return layer_;
  }

  std::string Layer::name() const {
    return from_c_string(OGR_L_GetName(c_ptr()));
  }

  Defn Layer::defn() const {
    return Defn(OGR_L_GetLayerDefn(c_ptr()), guard_);
  }

  FeatureRange Layer::features() const { return FeatureRange(*this); }

  std::optional<Feature> Layer::next_feature() const {
    OGRFeatureH feature = OGR_L_GetNextFeature(c_ptr());
    if (feature == nullptr) return std::nullopt;
    return Feature::from_c_ptr(feature);
  }

  void Layer::reset_reading() const { OGR_L_ResetReading(c_ptr()); }

  std::optional<Feature> Layer::feature(std::uint64_t fid) const {
    OGRFeatureH feature = OGR_L_GetFeature(c_ptr(), static_cast<GIntBig>(fid));
    if (feature == nullptr) return std::nullopt;
    return Feature::from_c_ptr(feature);
  }

  std::optional<std::uint64_t> Layer::feature_count(bool force) const {
    GIntBig count = OGR_L_GetFeatureCount(c_ptr(), force ? TRUE : FALSE);
    if (count < 0) return std::nullopt;
    return static_cast<std::uint64_t>(count);
  }

  void Layer::set_spatial_filter(const Geometry& geometry) {
    // OGR keeps a copy of the filter geometry
    OGR_L_SetSpatialFilter(c_ptr(), geometry.c_ptr());
  }

  void Layer::set_spatial_filter_rect(double min_x, double min_y, double max_x,
                                      double max_y) {
    OGR_L_SetSpatialFilterRect(c_ptr(), min_x, min_y, max_x, max_y);
  }

  void Layer::clear_spatial_filter() {
    OGR_L_SetSpatialFilter(c_ptr(), nullptr);
  }

  void Layer::set_attribute_filter(std::string_view query) {
    auto c_query = to_c_string(query);
    OGRErr rv = OGR_L_SetAttributeFilter(c_ptr(), c_query.c_str());
    if (rv != OGRERR_NONE) {
      throw OgrError(rv, "OGR_L_SetAttributeFilter");
    }
  }

  void Layer::clear_attribute_filter() {
    OGRErr rv = OGR_L_SetAttributeFilter(c_ptr(), nullptr);
    if (rv != OGRERR_NONE) {
      throw OgrError(rv, "OGR_L_SetAttributeFilter");
    }
  }

  std::optional<Envelope> Layer::extent(bool force) const {
    OGREnvelope env;
    if (OGR_L_GetExtent(c_ptr(), &env, force ? TRUE : FALSE) != OGRERR_NONE) {
      return std::nullopt;
    }
    return Envelope{env.MinX, env.MaxX, env.MinY, env.MaxY};
  }

  std::optional<SpatialRef> Layer::spatial_ref() const {
    OGRSpatialReferenceH srs = OGR_L_GetSpatialRef(c_ptr());
    if (srs == nullptr) return std::nullopt;
    return SpatialRef::from_c_obj(srs);
  }

  void Layer::create_defn_fields(
      const std::vector<std::pair<std::string, OGRFieldType>>& fields) {
    for (const auto& [name, type] : fields) {
      FieldDefn(name, type).add_to_layer(*this);
    }
  }

  void Layer::create_feature(const Geometry& geometry) {
    Feature feature(defn());
    feature.set_geometry(geometry);
    feature.create(*this);
  }

  void Layer::create_feature_fields(const Geometry& geometry,
                                    const std::vector<std::string>& field_names,
                                    const std::vector<FieldValue>& values) {
    if (field_names.size() != values.size()) {
      throw BadArgumentError(
          fmt::format("{} field names given for {} values", field_names.size(),
                      values.size()));
    }
    Feature feature(defn());
    feature.set_geometry(geometry);
    for (std::size_t i = 0; i < values.size(); ++i) {
      feature.set_field(field_names[i], values[i]);
    }
    feature.create(*this);
  }

  bool Layer::test_capability(std::string_view capability) const {
    auto c_capability = to_c_string(capability);
    return OGR_L_TestCapability(c_ptr(), c_capability.c_str()) != 0;
  }

}  // namespace geobind
