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

#include <string>
#include <string_view>
#include <vector>

#include <gdal_utils.h>

#include <geobind/io/dataset.hpp>
#include <geobind/programs/destination.hpp>

namespace geobind {

  /** @brief Parsed ogr2ogr command line arguments, eg. {"-f", "GPKG"}. */
  class VectorTranslateOptions {
   public:
    /** @brief Throws NullPointerError if GDAL rejects the arguments. */
    explicit VectorTranslateOptions(const std::vector<std::string>& args);
    ~VectorTranslateOptions();
    VectorTranslateOptions(VectorTranslateOptions&& other) noexcept;
    VectorTranslateOptions& operator=(VectorTranslateOptions&& other) noexcept;
    VectorTranslateOptions(const VectorTranslateOptions&) = delete;
    VectorTranslateOptions& operator=(const VectorTranslateOptions&) = delete;

    GDALVectorTranslateOptions* c_ptr() const { return options_; }

   private:
    GDALVectorTranslateOptions* options_ = nullptr;
  };

  /**
   * @brief Converts the vector data of `source` like ogr2ogr.
   *
   * A dataset destination is handed to GDAL: on success it is released and the
   * returned Dataset owns it, its earlier views expire. On failure it is
   * closed with `destination`.
   */
  Dataset vector_translate(const Dataset& source,
                           DatasetDestination destination,
                           const VectorTranslateOptions* options = nullptr);

  /** @brief Parsed gdalbuildvrt command line arguments. */
  class BuildVrtOptions {
   public:
    /** @brief Throws NullPointerError if GDAL rejects the arguments. */
    explicit BuildVrtOptions(const std::vector<std::string>& args);
    ~BuildVrtOptions();
    BuildVrtOptions(BuildVrtOptions&& other) noexcept;
    BuildVrtOptions& operator=(BuildVrtOptions&& other) noexcept;
    BuildVrtOptions(const BuildVrtOptions&) = delete;
    BuildVrtOptions& operator=(const BuildVrtOptions&) = delete;

    GDALBuildVRTOptions* c_ptr() const { return options_; }

   private:
    GDALBuildVRTOptions* options_ = nullptr;
  };

  /**
   * @brief Builds a VRT mosaic of the rasters at `source_paths`. The VRT opens
   * the sources itself. An empty `path` keeps it in memory.
   */
  Dataset build_vrt(std::string_view path,
                    const std::vector<std::string>& source_paths,
                    const BuildVrtOptions* options = nullptr);

}  // namespace geobind
