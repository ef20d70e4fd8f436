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

#include <geobind/common/errors.hpp>
#include <geobind/raster/geo_transform.hpp>

#include <gdal.h>

namespace geobind {

  // GDAL takes the coefficients through non-const pointers but only reads them

  arr2d apply_geo_transform(const GeoTransform& transformation, double pixel,
                            double line) {
    GeoTransform coefficients = transformation;
    arr2d result{};
    GDALApplyGeoTransform(coefficients.data(), pixel, line, &result[0],
                          &result[1]);
    return result;
  }

  GeoTransform invert_geo_transform(const GeoTransform& transformation) {
    GeoTransform coefficients = transformation;
    GeoTransform inverse{};
    if (!GDALInvGeoTransform(coefficients.data(), inverse.data())) {
      throw BadArgumentError("Geo transform is not invertible");
    }
    return inverse;
  }

}  // namespace geobind
