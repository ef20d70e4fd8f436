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
#include <geobind/logger/logger.h>
#include <geobind/programs/programs.hpp>

#include <cpl_error.h>

#include <climits>
#include <utility>

namespace geobind {

  VectorTranslateOptions::VectorTranslateOptions(
      const std::vector<std::string>& args) {
    auto c_args = CslStringList::from_strings(args);
    CPLErrorReset();
    options_ = GDALVectorTranslateOptionsNew(c_args.as_ptr(), nullptr);
    if (options_ == nullptr) {
      throw detail::last_null_pointer_err("GDALVectorTranslateOptionsNew");
    }
  }

  VectorTranslateOptions::~VectorTranslateOptions() {
    if (options_ != nullptr) GDALVectorTranslateOptionsFree(options_);
  }

  VectorTranslateOptions::VectorTranslateOptions(
      VectorTranslateOptions&& other) noexcept
      : options_(std::exchange(other.options_, nullptr)) {}

  VectorTranslateOptions& VectorTranslateOptions::operator=(
      VectorTranslateOptions&& other) noexcept {
    if (this != &other) {
      if (options_ != nullptr) GDALVectorTranslateOptionsFree(options_);
      options_ = std::exchange(other.options_, nullptr);
    }
    return *this;
  }

  Dataset vector_translate(const Dataset& source,
                           DatasetDestination destination,
                           const VectorTranslateOptions* options) {
    GDALDatasetH sources[] = {source.c_ptr()};
    GDALVectorTranslateOptions* c_options =
        options != nullptr ? options->c_ptr() : nullptr;
    auto& logger = logger::Logger::get_logger();

    CPLErrorReset();
    if (Dataset* target = destination.dataset_ptr()) {
      GDALDatasetH c_target = target->c_ptr();
      GDALDatasetH out =
          GDALVectorTranslate(nullptr, c_target, 1, sources, c_options, nullptr);
      if (out == nullptr) {
        throw detail::last_null_pointer_err("GDALVectorTranslate");
      }
      // GDAL returns the destination handle, the result takes it over
      target->release();
      logger.debug("Translated {} into an open dataset", source.description());
      return Dataset::from_c_ptr(out, "GDALVectorTranslate");
    }

    const std::string& path = *destination.path_ptr();
    GDALDatasetH out = GDALVectorTranslate(path.c_str(), nullptr, 1, sources,
                                           c_options, nullptr);
    if (out == nullptr) {
      throw detail::last_null_pointer_err("GDALVectorTranslate");
    }
    logger.debug("Translated {} to {}", source.description(), path);
    return Dataset::from_c_ptr(out, "GDALVectorTranslate");
  }

  BuildVrtOptions::BuildVrtOptions(const std::vector<std::string>& args) {
    auto c_args = CslStringList::from_strings(args);
    CPLErrorReset();
    options_ = GDALBuildVRTOptionsNew(c_args.as_ptr(), nullptr);
    if (options_ == nullptr) {
      throw detail::last_null_pointer_err("GDALBuildVRTOptionsNew");
    }
  }

  BuildVrtOptions::~BuildVrtOptions() {
    if (options_ != nullptr) GDALBuildVRTOptionsFree(options_);
  }

  BuildVrtOptions::BuildVrtOptions(BuildVrtOptions&& other) noexcept
      : options_(std::exchange(other.options_, nullptr)) {}

  BuildVrtOptions& BuildVrtOptions::operator=(BuildVrtOptions&& other) noexcept {
    if (this != &other) {
      if (options_ != nullptr) GDALBuildVRTOptionsFree(options_);
      options_ = std::exchange(other.options_, nullptr);
    }
    return *this;
  }

  Dataset build_vrt(std::string_view path,
                    const std::vector<std::string>& source_paths,
                    const BuildVrtOptions* options) {
    if (source_paths.size() > static_cast<std::size_t>(INT_MAX)) {
      throw BadArgumentError("Too many sources for a VRT");
    }
    auto c_path = to_c_string(path);
    auto c_sources = CslStringList::from_strings(source_paths);

    CPLErrorReset();
    GDALDatasetH out = GDALBuildVRT(
        c_path.c_str(), static_cast<int>(source_paths.size()), nullptr,
        c_sources.as_ptr(), options != nullptr ? options->c_ptr() : nullptr,
        nullptr);
    if (out == nullptr) {
      throw detail::last_null_pointer_err("GDALBuildVRT");
    }
    logger::Logger::get_logger().debug("Built a VRT of {} sources",
                                       source_paths.size());
    return Dataset::from_c_ptr(out, "GDALBuildVRT");
  }

}  // namespace geobind
