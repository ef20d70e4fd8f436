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


#include <geobind/common/cpl_string.hpp>
#include <geobind/common/errors.hpp>
#include <geobind/io/dataset.hpp>
#include <geobind/io/driver_manager.hpp>
#include <geobind/logger/logger.h>
#include <geobind/raster/raster_band.hpp>
#include <geobind/srs/spatial_ref.hpp>
#include <geobind/vector/geometry.hpp>
#include <geobind/vector/layer.hpp>
#include <geobind/vector/result_set.hpp>
#include <geobind/vector/transaction.hpp>

#include <cpl_error.h>
#include <gdal_version.h>
#include <fmt/format.h>

#include <climits>
#include <utility>

// GDALClose and GDALFlushCache report errors from GDAL 3.7 on
#define GEOBIND_GDAL_CLOSE_REPORTS_ERRORS \
  (GDAL_VERSION_NUM >= GDAL_COMPUTE_VERSION(3, 7, 0))

namespace geobind {

  namespace {
    int to_int(std::size_t value, const char* what) {
      if (value > static_cast<std::size_t>(INT_MAX)) {
        throw BadArgumentError(
            fmt::format("{} {} is out of range for GDAL", what, value));
      }
      return static_cast<int>(value);
    }

    const char* dialect_name(SqlDialect dialect) {
      switch (dialect) {
        case SqlDialect::Ogr:
          return "OGRSQL";
        case SqlDialect::Sqlite:
          return "SQLITE";
        case SqlDialect::Default:
          break;
      }
      return nullptr;
    }
  }  // namespace

  Dataset Dataset::open(std::string_view path) {
    return open_ex(path, DatasetOptions());
  }

  Dataset Dataset::open_ex(std::string_view path,
                           const DatasetOptions& options) {
    DriverManager::ensure_registered();
    auto c_path = to_c_string(path);
    auto allowed_drivers = CslStringList::from_strings(options.allowed_drivers);
    auto open_options = CslStringList::from_strings(options.open_options);
    auto sibling_files = CslStringList::from_strings(options.sibling_files);

    GDALDatasetH dataset = GDALOpenEx(
        c_path.c_str(), static_cast<unsigned int>(options.open_flags),
        allowed_drivers.as_ptr(), open_options.as_ptr(),
        sibling_files.as_ptr());
    if (dataset == nullptr) {
      throw detail::last_null_pointer_err("GDALOpenEx");
    }
    logger::Logger::get_logger().debug("Opened dataset '{}'", c_path);
    return Dataset(dataset);
  }

  Dataset Dataset::from_c_ptr(GDALDatasetH dataset, const std::string& call) {
    if (dataset == nullptr) {
      throw detail::last_null_pointer_err(call);
    }
    return Dataset(dataset);
  }

  Dataset::Dataset(Dataset&& other) noexcept
      : dataset_(std::exchange(other.dataset_, nullptr)),
        epoch_(std::move(other.epoch_)) {}

  Dataset& Dataset::operator=(Dataset&& other) noexcept {
    if (this != &other) {
      close_noexcept();
      dataset_ = std::exchange(other.dataset_, nullptr);
      epoch_ = std::move(other.epoch_);
    }
    return *this;
  }

  Dataset::~Dataset() { close_noexcept(); }

  void Dataset::close() {
    if (dataset_ == nullptr) return;
    epoch_.advance();
    GDALDatasetH dataset = std::exchange(dataset_, nullptr);
    std::string description = from_c_string(GDALGetDescription(dataset));
#if GEOBIND_GDAL_CLOSE_REPORTS_ERRORS
    CPLErr rv = GDALClose(dataset);
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
#else
    GDALClose(dataset);
#endif
    logger::Logger::get_logger().debug("Closed dataset '{}'", description);
  }

  void Dataset::close_noexcept() noexcept {
    if (dataset_ == nullptr) return;
    epoch_.advance();
    GDALDatasetH dataset = std::exchange(dataset_, nullptr);
#if GEOBIND_GDAL_CLOSE_REPORTS_ERRORS
    if (GDALClose(dataset) != CE_None) {
      logger::Logger::get_logger().warning(
          "Closing dataset failed: {}", from_c_string(CPLGetLastErrorMsg()));
      CPLErrorReset();
    }
#else
    GDALClose(dataset);
#endif
  }

  GDALDatasetH Dataset::release() {
    epoch_.advance();
    return std::exchange(dataset_, nullptr);
  }

  GDALDatasetH Dataset::c_ptr() const {
    if (dataset_ == nullptr) {
      throw BadArgumentError("Dataset is closed");
    }
    return dataset_;
  }

  void Dataset::flush_cache() {
#if GEOBIND_GDAL_CLOSE_REPORTS_ERRORS
    CPLErr rv = GDALFlushCache(c_ptr());
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
#else
    GDALFlushCache(c_ptr());
#endif
  }

  Driver Dataset::driver() const {
    return Driver::from_c_ptr(GDALGetDatasetDriver(c_ptr()),
                              "GDALGetDatasetDriver");
  }

  std::string Dataset::projection() const {
    return from_c_string(GDALGetProjectionRef(c_ptr()));
  }

  void Dataset::set_projection(std::string_view projection) {
    auto c_projection = to_c_string(projection);
    CPLErr rv = GDALSetProjection(c_ptr(), c_projection.c_str());
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
  }

  std::optional<SpatialRef> Dataset::spatial_ref() const {
    OGRSpatialReferenceH srs = GDALGetSpatialRef(c_ptr());
    if (srs == nullptr) return std::nullopt;
    return SpatialRef::from_c_obj(srs);
  }

  void Dataset::set_spatial_ref(const SpatialRef& srs) {
    CPLErr rv = GDALSetSpatialRef(c_ptr(), srs.c_ptr());
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
  }

  GeoTransform Dataset::geo_transform() const {
    GeoTransform transformation{};
    CPLErr rv = GDALGetGeoTransform(c_ptr(), transformation.data());
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
    return transformation;
  }

  void Dataset::set_geo_transform(const GeoTransform& transformation) {
    GeoTransform copy = transformation;
    CPLErr rv = GDALSetGeoTransform(c_ptr(), copy.data());
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
  }

  Dataset Dataset::create_copy(const Driver& driver, std::string_view filename,
                               const CslStringList& options) const {
    auto c_filename = to_c_string(filename);
    GDALDatasetH copy =
        GDALCreateCopy(driver.c_ptr(), c_filename.c_str(), c_ptr(), FALSE,
                       options.as_ptr(), nullptr, nullptr);
    return from_c_ptr(copy, "GDALCreateCopy");
  }

  Size2 Dataset::raster_size() const {
    GDALDatasetH dataset = c_ptr();
    return {static_cast<std::size_t>(GDALGetRasterXSize(dataset)),
            static_cast<std::size_t>(GDALGetRasterYSize(dataset))};
  }

  std::size_t Dataset::raster_count() const {
    return static_cast<std::size_t>(GDALGetRasterCount(c_ptr()));
  }

  RasterBand Dataset::rasterband(std::size_t band_index) const {
    // GDAL reports an illegal band number and returns NULL
    int c_index = band_index > static_cast<std::size_t>(INT_MAX)
                      ? 0
                      : static_cast<int>(band_index);
    GDALRasterBandH band = GDALGetRasterBand(c_ptr(), c_index);
    if (band == nullptr) {
      throw detail::last_null_pointer_err("GDALGetRasterBand");
    }
    return RasterBand(band, borrow());
  }

  std::vector<RasterBand> Dataset::rasterbands() const {
    std::size_t count = raster_count();
    std::vector<RasterBand> bands;
    bands.reserve(count);
    for (std::size_t i = 1; i <= count; ++i) {
      bands.push_back(rasterband(i));
    }
    return bands;
  }

  void Dataset::build_overviews(std::string_view resampling,
                                const std::vector<int>& levels) {
    auto c_resampling = to_c_string(resampling);
    std::vector<int> c_levels = levels;
    CPLErr rv = GDALBuildOverviews(
        c_ptr(), c_resampling.c_str(), to_int(c_levels.size(), "Level count"),
        c_levels.data(), 0, nullptr, nullptr, nullptr);
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
  }

  std::size_t Dataset::layer_count() const {
    return static_cast<std::size_t>(GDALDatasetGetLayerCount(c_ptr()));
  }

  Layer Dataset::layer(std::size_t index) const {
    int c_index =
        index > static_cast<std::size_t>(INT_MAX) ? -1 : static_cast<int>(index);
    OGRLayerH layer = GDALDatasetGetLayer(c_ptr(), c_index);
    if (layer == nullptr) {
      throw detail::last_null_pointer_err("GDALDatasetGetLayer");
    }
    return Layer(layer, borrow());
  }

  Layer Dataset::layer_by_name(std::string_view name) const {
    auto c_name = to_c_string(name);
    OGRLayerH layer = GDALDatasetGetLayerByName(c_ptr(), c_name.c_str());
    if (layer == nullptr) {
      throw detail::last_null_pointer_err("GDALDatasetGetLayerByName");
    }
    return Layer(layer, borrow());
  }

  std::vector<Layer> Dataset::layers() const {
    std::size_t count = layer_count();
    std::vector<Layer> layers;
    layers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      layers.push_back(layer(i));
    }
    return layers;
  }

  Layer Dataset::create_layer(const LayerOptions& options) {
    auto c_name = to_c_string(options.name);
    OGRLayerH layer = GDALDatasetCreateLayer(
        c_ptr(), c_name.c_str(),
        options.srs != nullptr ? options.srs->c_ptr() : nullptr, options.ty,
        options.options.as_ptr());
    if (layer == nullptr) {
      throw detail::last_null_pointer_err("GDALDatasetCreateLayer");
    }
    return Layer(layer, borrow());
  }

  std::optional<ResultSet> Dataset::execute_sql(std::string_view query,
                                                const Geometry* spatial_filter,
                                                SqlDialect dialect) {
    auto c_query = to_c_string(query);
    GDALDatasetH dataset = c_ptr();
    OGRGeometryH filter =
        spatial_filter != nullptr ? spatial_filter->c_ptr() : nullptr;

    // a NULL result is either a failure or a statement without rows
    CPLErrorReset();
    OGRLayerH result = GDALDatasetExecuteSQL(dataset, c_query.c_str(), filter,
                                             dialect_name(dialect));
    if (result == nullptr) {
      if (CPLGetLastErrorType() == CE_Failure) {
        throw detail::last_cpl_err(CE_Failure);
      }
      return std::nullopt;
    }
    return ResultSet(result, dataset, borrow());
  }

  Transaction Dataset::start_transaction(bool force) {
    GDALDatasetH dataset = c_ptr();
    OGRErr rv = GDALDatasetStartTransaction(dataset, force ? TRUE : FALSE);
    if (rv != OGRERR_NONE) {
      throw OgrError(rv, "GDALDatasetStartTransaction");
    }
    return Transaction(dataset, borrow());
  }

}  // namespace geobind
