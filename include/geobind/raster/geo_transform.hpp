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

#include <geobind/common/common.hpp>

namespace geobind {

  /**
   * @brief Maps pixel/line (P, L) to georeferenced (X, Y) with `transformation`
   * laid out as [x0, pixel width, row rotation, y0, column rotation, pixel
   * height].
   */
  arr2d apply_geo_transform(const GeoTransform& transformation, double pixel,
                            double line);

  /**
   * @brief The transform mapping (X, Y) back to (P, L). Throws
   * BadArgumentError if `transformation` is degenerate.
   */
  GeoTransform invert_geo_transform(const GeoTransform& transformation);

}  // namespace geobind
