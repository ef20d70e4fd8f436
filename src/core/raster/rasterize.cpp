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
#include <geobind/raster/rasterize.hpp>
#include <geobind/vector/geometry.hpp>

#include <gdal_alg.h>
#include <fmt/format.h>

#include <climits>
#include <string>
#include <vector>

namespace geobind {

  namespace {
    CslStringList to_string_list(const RasterizeOptions& options) {
      CslStringList list;
      list.set_name_value("ALL_TOUCHED", options.all_touched ? "TRUE" : "FALSE");
      list.set_name_value("MERGE_ALG",
                          options.merge_algorithm == MergeAlgorithm::Add
                              ? "ADD"
                              : "REPLACE");
      list.set_name_value("CHUNKYSIZE", std::to_string(options.chunk_y_size));
      switch (options.optimize) {
        case OptimizeMode::Automatic:
          list.set_name_value("OPTIM", "AUTO");
          break;
        case OptimizeMode::Raster:
          list.set_name_value("OPTIM", "RASTER");
          break;
        case OptimizeMode::Vector:
          list.set_name_value("OPTIM", "VECTOR");
          break;
      }
      if (options.source == BurnSource::Z) {
        list.set_name_value("BURN_VALUE_FROM", "Z");
      }
      return list;
    }
  }  // namespace

  void rasterize(Dataset& dataset, std::span<const int> bands,
                 std::span<const Geometry> geometries,
                 std::span<const double> burn_values,
                 const RasterizeOptions& options) {
    if (bands.empty()) {
      throw BadArgumentError("Rasterize needs at least one band");
    }
    if (burn_values.size() != geometries.size()) {
      throw BadArgumentError(fmt::format(
          "Rasterize got {} geometries but {} burn values", geometries.size(),
          burn_values.size()));
    }
    if (geometries.size() > static_cast<std::size_t>(INT_MAX) ||
        bands.size() > static_cast<std::size_t>(INT_MAX)) {
      throw BadArgumentError("Too many geometries or bands to rasterize");
    }

    // GDAL wants one burn value per band for every geometry
    std::vector<int> band_list(bands.begin(), bands.end());
    std::vector<OGRGeometryH> handles;
    std::vector<double> values;
    handles.reserve(geometries.size());
    values.reserve(geometries.size() * bands.size());
    for (std::size_t i = 0; i < geometries.size(); ++i) {
      handles.push_back(geometries[i].c_ptr());
      values.insert(values.end(), bands.size(), burn_values[i]);
    }
    auto c_options = to_string_list(options);

    CPLErr rv = GDALRasterizeGeometries(
        dataset.c_ptr(), static_cast<int>(band_list.size()), band_list.data(),
        static_cast<int>(handles.size()), handles.data(), nullptr, nullptr,
        values.data(), c_options.as_ptr(), nullptr, nullptr);
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
  }

}  // namespace geobind
