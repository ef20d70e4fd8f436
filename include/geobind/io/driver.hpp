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
#include <string>
#include <string_view>

#include <gdal.h>

#include <geobind/common/cpl_string.hpp>
#include <geobind/common/metadata.hpp>
#include <geobind/raster/gdal_type.hpp>

namespace geobind {

  class Dataset;

  /**
   * @brief A format driver in GDAL's global driver table.
   *
   * Drivers are owned by GDAL's driver manager and are never destroyed
   * through this wrapper. Deregistering a driver keeps the handle usable for
   * registering it again.
   */
  class Driver : public MetadataInterface {
   public:
    /**
     * @brief Wraps a driver handle, throws NullPointerError naming `call` if
     * it is NULL.
     */
    static Driver from_c_ptr(GDALDriverH driver,
                             const std::string& call = "GDALDriverH");

    /**
     * @brief Driver by short name, eg. "GTiff". Registers all drivers first
     * unless that was prevented. Throws NullPointerError if there is no such
     * driver, see DriverManager::get_driver_by_name for a non-throwing lookup.
     */
    static Driver get_by_name(std::string_view name);
    static Driver get(std::size_t index);

    GDALDriverH c_ptr() const { return driver_; }
    GDALMajorObjectH major_object_ptr() const override { return driver_; }

    std::string short_name() const;
    std::string long_name() const;

    /** @brief Creates a raster dataset with `bands` bands of bytes. */
    Dataset create(std::string_view filename, std::size_t size_x,
                   std::size_t size_y, std::size_t bands) const;

    template <GdalPixel T>
    Dataset create_with_band_type(std::string_view filename, std::size_t size_x,
                                  std::size_t size_y, std::size_t bands) const;

    template <GdalPixel T>
    Dataset create_with_band_type_with_options(
        std::string_view filename, std::size_t size_x, std::size_t size_y,
        std::size_t bands, const CslStringList& options) const;

    Dataset create_with_data_type(std::string_view filename,
                                  std::size_t size_x, std::size_t size_y,
                                  std::size_t bands, GDALDataType data_type,
                                  const CslStringList& options) const;

    /** @brief Creates a dataset without raster bands, eg. for vector data. */
    Dataset create_vector_only(std::string_view filename) const;

    bool operator==(const Driver& other) const {
      return driver_ == other.driver_;
    }

   private:
    explicit Driver(GDALDriverH driver) : driver_(driver){};
    GDALDriverH driver_;
  };

}  // namespace geobind
