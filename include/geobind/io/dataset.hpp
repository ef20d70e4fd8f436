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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gdal.h>
#include <ogr_api.h>

#include <geobind/common/borrow.hpp>
#include <geobind/common/common.hpp>
#include <geobind/common/cpl_string.hpp>
#include <geobind/common/metadata.hpp>
#include <geobind/io/driver.hpp>

namespace geobind {

  class Geometry;
  class Layer;
  class RasterBand;
  class ResultSet;
  class SpatialRef;
  class Transaction;

  /** @brief GDAL_OF_* flags for Dataset::open_ex. */
  enum class OpenFlags : unsigned int {
    ReadOnly = GDAL_OF_READONLY,
    Update = GDAL_OF_UPDATE,
    All = GDAL_OF_ALL,
    Raster = GDAL_OF_RASTER,
    Vector = GDAL_OF_VECTOR,
    Gnm = GDAL_OF_GNM,
    Multidim = GDAL_OF_MULTIDIM_RASTER,
    Shared = GDAL_OF_SHARED,
    Verbose = GDAL_OF_VERBOSE_ERROR,
    Internal = GDAL_OF_INTERNAL,
  };

  constexpr OpenFlags operator|(OpenFlags a, OpenFlags b) {
    return static_cast<OpenFlags>(static_cast<unsigned int>(a) |
                                  static_cast<unsigned int>(b));
  }
  constexpr bool has_flag(OpenFlags flags, OpenFlags flag) {
    return (static_cast<unsigned int>(flags) &
            static_cast<unsigned int>(flag)) != 0;
  }

  struct DatasetOptions {
    OpenFlags open_flags = OpenFlags::ReadOnly;
    /**
     * @brief Short names of the drivers that may open the dataset, all when
     * empty.
     */
    std::vector<std::string> allowed_drivers;
    /** @brief Driver specific open options as KEY=VALUE. */
    std::vector<std::string> open_options;
    /**
     * @brief Files next to the dataset, saves the driver from listing the
     * directory.
     */
    std::vector<std::string> sibling_files;
  };

  struct LayerOptions {
    std::string name;
    /** @brief Not owned, copied by GDAL. */
    const SpatialRef* srs = nullptr;
    OGRwkbGeometryType ty = wkbUnknown;
    CslStringList options;
  };

  /** @brief A ground control point, raster (pixel, line) tied to (x, y, z). */
  struct Gcp {
    std::string id;
    std::string info;
    double pixel = 0;
    double line = 0;
    double x = 0;
    double y = 0;
    double z = 0;
  };

  enum class SqlDialect {
    Default,
    Ogr,
    Sqlite,
  };

  /**
   * @brief Owns a GDAL dataset.
   *
   * The dataset is closed exactly once, by close() or by the destructor.
   * RasterBand and Layer objects obtained from it are views, they throw
   * BorrowExpiredError when used after the dataset is closed. Moving a Dataset
   * keeps its views valid.
   *
   * A Dataset may be moved to another thread, but must not be used by
   * several threads at once.
   */
  class Dataset : public MetadataInterface {
   public:
    static Dataset open(std::string_view path);
    static Dataset open_ex(std::string_view path,
                           const DatasetOptions& options);

    /**
     * @brief Takes ownership of `dataset`, throws NullPointerError naming
     * `call` if it is NULL.
     */
    static Dataset from_c_ptr(GDALDatasetH dataset,
                              const std::string& call = "GDALDatasetH");

    Dataset(Dataset&& other) noexcept;
    Dataset& operator=(Dataset&& other) noexcept;
    Dataset(const Dataset&) = delete;
    Dataset& operator=(const Dataset&) = delete;
    ~Dataset() override;

    /**
     * @brief Closes the dataset and invalidates its views. Reports errors of
     * the final flush as NativeError (GDAL 3.7 and later).
     */
    void close();

    /**
     * @brief Gives up ownership of the handle, eg. when it is passed to a GDAL
     * call that closes it. The destructor then leaves the dataset alone.
     */
    GDALDatasetH release();

    bool is_open() const { return dataset_ != nullptr; }
    GDALDatasetH c_ptr() const;
    GDALMajorObjectH major_object_ptr() const override { return c_ptr(); }

    /** @brief A guard that expires when this dataset closes. */
    BorrowGuard borrow() const { return epoch_.issue(); }

    void flush_cache();

    Driver driver() const;

    std::string projection() const;
    void set_projection(std::string_view projection);
    std::optional<SpatialRef> spatial_ref() const;
    void set_spatial_ref(const SpatialRef& srs);

    GeoTransform geo_transform() const;
    void set_geo_transform(const GeoTransform& transformation);

    Dataset create_copy(const Driver& driver, std::string_view filename,
                        const CslStringList& options = CslStringList()) const;

    // raster

    Size2 raster_size() const;
    std::size_t raster_count() const;
    /** @brief Band `band_index`, 1-based. */
    RasterBand rasterband(std::size_t band_index) const;
    std::vector<RasterBand> rasterbands() const;

    // ground control points, separate from the geo transform and projection

    std::size_t gcp_count() const;
    std::vector<Gcp> gcps() const;
    /** @brief WKT of the GCP coordinates, nullopt without GCPs. */
    std::optional<std::string> gcp_projection() const;
    std::optional<SpatialRef> gcp_spatial_ref() const;
    /** @brief Replaces the GCPs, `srs` may be NULL. */
    void set_gcps(const std::vector<Gcp>& gcps, const SpatialRef* srs);

    /**
     * @brief Builds overviews for all bands, eg. resampling "NEAREST" and
     * levels {2, 4}.
     */
    void build_overviews(std::string_view resampling,
                         const std::vector<int>& levels);

    // vector

    std::size_t layer_count() const;
    Layer layer(std::size_t index) const;
    Layer layer_by_name(std::string_view name) const;
    std::vector<Layer> layers() const;
    Layer create_layer(const LayerOptions& options);

    /**
     * @brief Runs `query`. Statements without a result set (eg. DROP TABLE)
     * return nullopt.
     */
    std::optional<ResultSet> execute_sql(
        std::string_view query, const Geometry* spatial_filter = nullptr,
        SqlDialect dialect = SqlDialect::Default);

    /**
     * @brief Starts a transaction, `force` allows emulated transactions on
     * drivers without native support.
     */
    Transaction start_transaction(bool force = false);

   private:
    explicit Dataset(GDALDatasetH dataset) : dataset_(dataset){};
    void close_noexcept() noexcept;

    GDALDatasetH dataset_ = nullptr;
    Epoch epoch_;
  };

  // Driver members returning Dataset need the complete type
  template <GdalPixel T>
  Dataset Driver::create_with_band_type(std::string_view filename,
                                        std::size_t size_x, std::size_t size_y,
                                        std::size_t bands) const {
    return create_with_data_type(filename, size_x, size_y, bands,
                                 GdalType<T>::datatype, CslStringList());
  }

  template <GdalPixel T>
  Dataset Driver::create_with_band_type_with_options(
      std::string_view filename, std::size_t size_x, std::size_t size_y,
      std::size_t bands, const CslStringList& options) const {
    return create_with_data_type(filename, size_x, size_y, bands,
                                 GdalType<T>::datatype, options);
  }

}  // namespace geobind
