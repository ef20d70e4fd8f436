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
#include <span>
#include <string>
#include <string_view>

#include <ogr_srs_api.h>

#include <geobind/srs/spatial_ref.hpp>

namespace geobind {

  class CoordTransformOptions {
   public:
    CoordTransformOptions();
    ~CoordTransformOptions();
    CoordTransformOptions(CoordTransformOptions&& other) noexcept;
    CoordTransformOptions& operator=(CoordTransformOptions&& other) noexcept;
    CoordTransformOptions(const CoordTransformOptions&) = delete;
    CoordTransformOptions& operator=(const CoordTransformOptions&) = delete;

    /** @brief Restricts candidate operations to this area, in degrees. */
    void set_area_of_interest(double west_longitude_deg,
                              double south_latitude_deg,
                              double east_longitude_deg,
                              double north_latitude_deg);
    /** @brief Accuracy in meters, operations worse than this are skipped. */
    void set_desired_accuracy(double accuracy);
    /** @brief Whether ballpark transformations may be used. */
    void set_ballpark_allowed(bool ballpark_allowed);
    /**
     * @brief Forces a specific operation, as a PROJ pipeline or CRS code.
     * `reverse` applies it from target to source.
     */
    void set_coordinate_operation(std::string_view co, bool reverse);

    OGRCoordinateTransformationOptionsH c_ptr() const { return options_; }

   private:
    OGRCoordinateTransformationOptionsH options_ = nullptr;
  };

  /**
   * @brief Owns a coordinate transformation between two spatial references.
   * The references are only read during construction.
   */
  class CoordTransform {
   public:
    CoordTransform(const SpatialRef& source, const SpatialRef& target);
    CoordTransform(const SpatialRef& source, const SpatialRef& target,
                   const CoordTransformOptions& options);
    ~CoordTransform();
    CoordTransform(CoordTransform&& other) noexcept;
    CoordTransform& operator=(CoordTransform&& other) noexcept;
    CoordTransform(const CoordTransform&) = delete;
    CoordTransform& operator=(const CoordTransform&) = delete;

    /**
     * @brief Transforms coordinates in place. `z` may be empty, otherwise
     * all three spans have the same length. Throws
     * InvalidCoordinateRangeError if any point fails.
     */
    void transform_coords(std::span<double> x, std::span<double> y,
                          std::span<double> z) const;

    /**
     * @brief Transforms the box [xmin, ymin, xmax, ymax], densifying every
     * edge with `densify_pts` points.
     */
    std::array<double, 4> transform_bounds(const std::array<double, 4>& bounds,
                                           int densify_pts) const;

    OGRCoordinateTransformationH c_ptr() const { return transform_; }

   private:
    // authority or PROJ string of the references, for error messages. Built
    // before the handle so nothing can throw once it exists.
    std::string from_;
    std::string to_;
    OGRCoordinateTransformationH transform_ = nullptr;
  };

}  // namespace geobind
