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
#include <geobind/srs/spatial_ref.hpp>

#include <charconv>
#include <utility>

namespace geobind {

  namespace {
    void check_ogr_err(OGRErr rv, const char* call) {
      if (rv != OGRERR_NONE) {
        throw OgrError(rv, call);
      }
    }

    std::optional<std::string> optional_string(const char* text) {
      if (text == nullptr) return std::nullopt;
      return std::string(text);
    }
  }  // namespace

  SpatialRef::SpatialRef() : srs_(OSRNewSpatialReference(nullptr)) {
    if (srs_ == nullptr) {
      throw detail::last_null_pointer_err("OSRNewSpatialReference");
    }
  }

  SpatialRef SpatialRef::from_definition(std::string_view definition) {
    auto c_definition = to_c_string(definition);
    SpatialRef srs;
    check_ogr_err(OSRSetFromUserInput(srs.srs_, c_definition.c_str()),
                  "OSRSetFromUserInput");
    return srs;
  }

  SpatialRef SpatialRef::from_wkt(std::string_view wkt) {
    auto c_wkt = to_c_string(wkt);
    OGRSpatialReferenceH srs = OSRNewSpatialReference(c_wkt.c_str());
    if (srs == nullptr) {
      throw detail::last_null_pointer_err("OSRNewSpatialReference");
    }
    return SpatialRef(srs);
  }

  SpatialRef SpatialRef::from_epsg(int epsg_code) {
    SpatialRef srs;
    check_ogr_err(OSRImportFromEPSG(srs.srs_, epsg_code), "OSRImportFromEPSG");
    return srs;
  }

  SpatialRef SpatialRef::from_proj4(std::string_view proj4_string) {
    auto c_proj4 = to_c_string(proj4_string);
    SpatialRef srs;
    check_ogr_err(OSRImportFromProj4(srs.srs_, c_proj4.c_str()),
                  "OSRImportFromProj4");
    return srs;
  }

  SpatialRef SpatialRef::from_esri(std::string_view esri_wkt) {
    // OSRImportFromESRI takes the lines of a .prj file
    CslStringList lines;
    lines.add_string(esri_wkt);
    SpatialRef srs;
    check_ogr_err(OSRImportFromESRI(srs.srs_, lines.as_ptr()),
                  "OSRImportFromESRI");
    return srs;
  }

  SpatialRef SpatialRef::from_c_ptr(OGRSpatialReferenceH srs) {
    if (srs == nullptr) {
      throw detail::last_null_pointer_err("OGRSpatialReferenceH");
    }
    return SpatialRef(srs);
  }

  SpatialRef SpatialRef::from_c_obj(OGRSpatialReferenceH srs) {
    if (srs == nullptr) {
      throw detail::last_null_pointer_err("OGRSpatialReferenceH");
    }
    OGRSpatialReferenceH cloned = OSRClone(srs);
    if (cloned == nullptr) {
      throw detail::last_null_pointer_err("OSRClone");
    }
    return SpatialRef(cloned);
  }

  SpatialRef::SpatialRef(const SpatialRef& other)
      : srs_(other.clone().release()) {}

  SpatialRef& SpatialRef::operator=(const SpatialRef& other) {
    if (this != &other) {
      SpatialRef copy(other);
      std::swap(srs_, copy.srs_);
    }
    return *this;
  }

  SpatialRef::SpatialRef(SpatialRef&& other) noexcept
      : srs_(std::exchange(other.srs_, nullptr)) {}

  SpatialRef& SpatialRef::operator=(SpatialRef&& other) noexcept {
    if (this != &other) {
      if (srs_ != nullptr) OSRRelease(srs_);
      srs_ = std::exchange(other.srs_, nullptr);
    }
    return *this;
  }

  SpatialRef::~SpatialRef() {
    if (srs_ != nullptr) OSRRelease(srs_);
  }

  SpatialRef SpatialRef::clone() const { return from_c_obj(srs_); }

  bool SpatialRef::operator==(const SpatialRef& other) const {
    if (srs_ == nullptr || other.srs_ == nullptr) return srs_ == other.srs_;
    return OSRIsSame(srs_, other.srs_) != 0;
  }

  OGRSpatialReferenceH SpatialRef::release() {
    return std::exchange(srs_, nullptr);
  }

  std::string SpatialRef::to_wkt() const {
    char* wkt = nullptr;
    OGRErr rv = OSRExportToWkt(srs_, &wkt);
    std::string result = take_cpl_string(wkt);
    check_ogr_err(rv, "OSRExportToWkt");
    return result;
  }

  std::string SpatialRef::to_pretty_wkt() const {
    char* wkt = nullptr;
    OGRErr rv = OSRExportToPrettyWkt(srs_, &wkt, FALSE);
    std::string result = take_cpl_string(wkt);
    check_ogr_err(rv, "OSRExportToPrettyWkt");
    return result;
  }

  std::string SpatialRef::to_xml() const {
    char* xml = nullptr;
    OGRErr rv = OSRExportToXML(srs_, &xml, nullptr);
    std::string result = take_cpl_string(xml);
    check_ogr_err(rv, "OSRExportToXML");
    return result;
  }

  std::string SpatialRef::to_proj4() const {
    char* proj4 = nullptr;
    OGRErr rv = OSRExportToProj4(srs_, &proj4);
    std::string result = take_cpl_string(proj4);
    check_ogr_err(rv, "OSRExportToProj4");
    return result;
  }

  std::string SpatialRef::to_projjson() const {
    char* json = nullptr;
    OGRErr rv = OSRExportToPROJJSON(srs_, &json, nullptr);
    std::string result = take_cpl_string(json);
    check_ogr_err(rv, "OSRExportToPROJJSON");
    return result;
  }

  void SpatialRef::morph_to_esri() {
    check_ogr_err(OSRMorphToESRI(srs_), "OSRMorphToESRI");
  }

  std::optional<std::string> SpatialRef::auth_name() const {
    return optional_string(OSRGetAuthorityName(srs_, nullptr));
  }

  std::optional<int> SpatialRef::auth_code() const {
    const char* code = OSRGetAuthorityCode(srs_, nullptr);
    if (code == nullptr) return std::nullopt;
    std::string_view text(code);
    int value = 0;
    auto [end, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    // codes of some authorities are not numeric
    if (ec != std::errc() || end != text.data() + text.size()) {
      return std::nullopt;
    }
    return value;
  }

  std::optional<std::string> SpatialRef::authority() const {
    auto name = auth_name();
    const char* code = OSRGetAuthorityCode(srs_, nullptr);
    if (!name || code == nullptr) return std::nullopt;
    return *name + ":" + code;
  }

  void SpatialRef::auto_identify_epsg() {
    check_ogr_err(OSRAutoIdentifyEPSG(srs_), "OSRAutoIdentifyEPSG");
  }

  std::optional<std::string> SpatialRef::name() const {
    return optional_string(OSRGetName(srs_));
  }

  LinearUnits SpatialRef::linear_units() const {
    char* unit_name = nullptr;
    double factor = OSRGetLinearUnits(srs_, &unit_name);
    // the name points into the reference and must not be freed
    return {from_c_string(unit_name), factor};
  }

  AngularUnits SpatialRef::angular_units() const {
    char* unit_name = nullptr;
    double factor = OSRGetAngularUnits(srs_, &unit_name);
    return {from_c_string(unit_name), factor};
  }

  double SpatialRef::semi_major() const {
    OGRErr rv = OGRERR_NONE;
    double value = OSRGetSemiMajor(srs_, &rv);
    check_ogr_err(rv, "OSRGetSemiMajor");
    return value;
  }

  double SpatialRef::semi_minor() const {
    OGRErr rv = OGRERR_NONE;
    double value = OSRGetSemiMinor(srs_, &rv);
    check_ogr_err(rv, "OSRGetSemiMinor");
    return value;
  }

  bool SpatialRef::is_geographic() const { return OSRIsGeographic(srs_) != 0; }
  bool SpatialRef::is_projected() const { return OSRIsProjected(srs_) != 0; }
  bool SpatialRef::is_local() const { return OSRIsLocal(srs_) != 0; }
  bool SpatialRef::is_compound() const { return OSRIsCompound(srs_) != 0; }
  bool SpatialRef::is_geocentric() const { return OSRIsGeocentric(srs_) != 0; }
  bool SpatialRef::is_vertical() const { return OSRIsVertical(srs_) != 0; }

  AxisMappingStrategy SpatialRef::axis_mapping_strategy() const {
    return static_cast<AxisMappingStrategy>(OSRGetAxisMappingStrategy(srs_));
  }

  void SpatialRef::set_axis_mapping_strategy(AxisMappingStrategy strategy) {
    OSRSetAxisMappingStrategy(srs_,
                              static_cast<OSRAxisMappingStrategy>(strategy));
  }

  std::optional<AreaOfUse> SpatialRef::area_of_use() const {
    AreaOfUse area;
    const char* area_name = nullptr;
    if (!OSRGetAreaOfUse(srs_, &area.west_lon_degree, &area.south_lat_degree,
                         &area.east_lon_degree, &area.north_lat_degree,
                         &area_name)) {
      return std::nullopt;
    }
    area.name = from_c_string(area_name);
    return area;
  }

}  // namespace geobind
