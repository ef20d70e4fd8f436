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

#include <gdalwarper.h>

namespace geobind {

  class Dataset;

  /** @brief Resampling kernels of the warper. */
  enum class WarpResampleAlg {
    NearestNeighbour = GRA_NearestNeighbour,
    Bilinear = GRA_Bilinear,
    Cubic = GRA_Cubic,
    CubicSpline = GRA_CubicSpline,
    Lanczos = GRA_Lanczos,
    Average = GRA_Average,
    Mode = GRA_Mode,
    Max = GRA_Max,
    Min = GRA_Min,
    Med = GRA_Med,
    Q1 = GRA_Q1,
    Q3 = GRA_Q3,
    Sum = GRA_Sum,
  };

  /**
   * @brief Warps `source` into the existing `destination`, using the
   * projection and geo transform of both. `max_error` is the approximation
   * error in pixels, 0 for exact transformations.
   */
  void reproject(const Dataset& source, Dataset& destination,
                 WarpResampleAlg resample = WarpResampleAlg::Bilinear,
                 double max_error = 0.0);

}  // namespace geobind
