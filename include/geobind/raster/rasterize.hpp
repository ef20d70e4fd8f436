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
#include <span>

namespace geobind {

  class Dataset;
  class Geometry;

  enum class BurnSource {
    // the burn values as given
    UserSupplied,
    // the geometry's Z value plus the burn value, points and lines only
    Z,
  };

  enum class MergeAlgorithm {
    Replace,
    Add,
  };

  enum class OptimizeMode {
    Automatic,
    Raster,
    Vector,
  };

  struct RasterizeOptions {
    /**
     * @brief Burn every pixel touched by a line or polygon, not only those
     * whose center is inside.
     */
    bool all_touched = false;
    BurnSource source = BurnSource::UserSupplied;
    MergeAlgorithm merge_algorithm = MergeAlgorithm::Replace;
    /**
     * @brief Lines per chunk, 0 lets GDAL derive it from the block cache
     * size. Unused with OptimizeMode::Raster.
     */
    std::size_t chunk_y_size = 0;
    OptimizeMode optimize = OptimizeMode::Automatic;
  };

  /**
   * @brief Burns `geometries` into the 1-based `bands` of `dataset`. The
   * geometries are in the dataset's georeferenced coordinates and each has
   * one burn value, used for every band. Throws BadArgumentError when `bands`
   * is empty or the counts of geometries and burn values differ.
   */
  void rasterize(Dataset& dataset, std::span<const int> bands,
                 std::span<const Geometry> geometries,
                 std::span<const double> burn_values,
                 const RasterizeOptions& options = RasterizeOptions());

}  // namespace geobind
