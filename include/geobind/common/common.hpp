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

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace geobind {

  typedef std::array<double, 2> arr2d;
  typedef std::array<double, 3> arr3d;
  typedef std::vector<arr3d> vec3d;

  // (columns, rows) of a raster, window or buffer
  typedef std::array<std::size_t, 2> Size2;
  // (x, y) pixel offset of a raster window
  typedef std::array<std::int64_t, 2> Offset2;

  /**
   * @brief Affine transform between pixel/line and georeferenced space, in
   * the GDAL coefficient order:
   * Xgeo = gt[0] + col * gt[1] + row * gt[2]
   * Ygeo = gt[3] + col * gt[4] + row * gt[5]
   */
  typedef std::array<double, 6> GeoTransform;

  struct Envelope {
    double min_x = 0;
    double max_x = 0;
    double min_y = 0;
    double max_y = 0;

    double size_x() const { return max_x - min_x; };
    double size_y() const { return max_y - min_y; };
    bool operator==(const Envelope&) const = default;
  };

  struct Envelope3D {
    double min_x = 0;
    double max_x = 0;
    double min_y = 0;
    double max_y = 0;
    double min_z = 0;
    double max_z = 0;

    bool operator==(const Envelope3D&) const = default;
  };

  // modelled after
  // https://gdal.org/api/ogrfeature_cpp.html#_CPPv4NK10OGRFeature18GetFieldAsDateTimeEiPiPiPiPiPiPiPi
  struct Date {
    int year = 0;
    int month = 0;
    int day = 0;
    std::string format_to_ietf() const;
    bool operator==(const Date&) const = default;
  };
  struct Time {
    int hour = 0;
    int minute = 0;
    float second = 0;
    // 0=unknown, 1=localtime, 100=GMT, 100+n is GMT plus n*15 minutes
    int timeZone = 0;
    bool operator==(const Time&) const = default;
  };
  struct DateTime {
    Date date;
    Time time;
    std::string format_to_ietf() const;
    bool operator==(const DateTime&) const = default;
  };

}  // namespace geobind
