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
#include <geobind/srs/coord_transform.hpp>

#include <cpl_error.h>
#include <fmt/format.h>

#include <climits>
#include <utility>

namespace geobind {

  namespace {
    std::string describe(const SpatialRef& srs) {
      if (auto authority = srs.authority()) return *authority;
      char* proj4 = nullptr;
      OGRErr rv = OSRExportToProj4(srs.c_ptr(), &proj4);
      std::string result = take_cpl_string(proj4);
      if (rv == OGRERR_NONE && !result.empty()) return result;
      CPLErrorReset();
      return srs.name().value_or("unknown");
    }
  }  // namespace

  CoordTransformOptions::CoordTransformOptions()
      : options_(OCTNewCoordinateTransformationOptions()) {
    if (options_ == nullptr) {
      throw detail::last_null_pointer_err(
          "OCTNewCoordinateTransformationOptions");
    }
  }

  CoordTransformOptions::~CoordTransformOptions() {
    if (options_ != nullptr) OCTDestroyCoordinateTransformationOptions(options_);
  }

  CoordTransformOptions::CoordTransformOptions(
      CoordTransformOptions&& other) noexcept
      : options_(std::exchange(other.options_, nullptr)) {}

  CoordTransformOptions& CoordTransformOptions::operator=(
      CoordTransformOptions&& other) noexcept {
    if (this != &other) {
      if (options_ != nullptr) {
        OCTDestroyCoordinateTransformationOptions(options_);
      }
      options_ = std::exchange(other.options_, nullptr);
    }
    return *this;
  }

  // The setters return FALSE on failure and leave a CPL error behind.

  void CoordTransformOptions::set_area_of_interest(double west_longitude_deg,
                                                   double south_latitude_deg,
                                                   double east_longitude_deg,
                                                   double north_latitude_deg) {
    if (!OCTCoordinateTransformationOptionsSetAreaOfInterest(
            options_, west_longitude_deg, south_latitude_deg,
            east_longitude_deg, north_latitude_deg)) {
      throw detail::last_cpl_err(CE_Failure);
    }
  }

  void CoordTransformOptions::set_desired_accuracy(double accuracy) {
    if (!OCTCoordinateTransformationOptionsSetDesiredAccuracy(options_,
                                                             accuracy)) {
      throw detail::last_cpl_err(CE_Failure);
    }
  }

  void CoordTransformOptions::set_ballpark_allowed(bool ballpark_allowed) {
    if (!OCTCoordinateTransformationOptionsSetBallparkAllowed(
            options_, ballpark_allowed ? TRUE : FALSE)) {
      throw detail::last_cpl_err(CE_Failure);
    }
  }

  void CoordTransformOptions::set_coordinate_operation(std::string_view co,
                                                       bool reverse) {
    auto c_co = to_c_string(co);
    if (!OCTCoordinateTransformationOptionsSetOperation(
            options_, c_co.c_str(), reverse ? TRUE : FALSE)) {
      throw detail::last_cpl_err(CE_Failure);
    }
  }

  CoordTransform::CoordTransform(const SpatialRef& source,
                                 const SpatialRef& target)
      : from_(describe(source)),
        to_(describe(target)),
        transform_(OCTNewCoordinateTransformation(source.c_ptr(),
                                                  target.c_ptr())) {
    if (transform_ == nullptr) {
      throw detail::last_null_pointer_err("OCTNewCoordinateTransformation");
    }
  }

  CoordTransform::CoordTransform(const SpatialRef& source,
                                 const SpatialRef& target,
                                 const CoordTransformOptions& options)
      : from_(describe(source)),
        to_(describe(target)),
        transform_(OCTNewCoordinateTransformationEx(
            source.c_ptr(), target.c_ptr(), options.c_ptr())) {
    if (transform_ == nullptr) {
      throw detail::last_null_pointer_err("OCTNewCoordinateTransformationEx");
    }
  }

  CoordTransform::~CoordTransform() {
    if (transform_ != nullptr) OCTDestroyCoordinateTransformation(transform_);
  }

  CoordTransform::CoordTransform(CoordTransform&& other) noexcept
      : from_(std::move(other.from_)),
        to_(std::move(other.to_)),
        transform_(std::exchange(other.transform_, nullptr)) {}

  CoordTransform& CoordTransform::operator=(CoordTransform&& other) noexcept {
    if (this != &other) {
      if (transform_ != nullptr) OCTDestroyCoordinateTransformation(transform_);
      transform_ = std::exchange(other.transform_, nullptr);
      from_ = std::move(other.from_);
      to_ = std::move(other.to_);
    }
    return *this;
  }

  void CoordTransform::transform_coords(std::span<double> x,
                                        std::span<double> y,
                                        std::span<double> z) const {
    if (x.size() != y.size() || (!z.empty() && z.size() != x.size())) {
      throw BadArgumentError(fmt::format(
          "Coordinate arrays differ in length: x {}, y {}, z {}", x.size(),
          y.size(), z.size()));
    }
    if (x.size() > static_cast<std::size_t>(INT_MAX)) {
      throw BadArgumentError(
          fmt::format("Too many points to transform: {}", x.size()));
    }
    if (x.empty()) return;

    CPLErrorReset();
    int ok = OCTTransform(transform_, static_cast<int>(x.size()), x.data(),
                          y.data(), z.empty() ? nullptr : z.data());
    if (!ok) {
      std::string message = from_c_string(CPLGetLastErrorMsg());
      CPLErrorReset();
      if (message.empty()) message = "Unknown";
      throw InvalidCoordinateRangeError(from_, to_, message);
    }
  }

  std::array<double, 4> CoordTransform::transform_bounds(
      const std::array<double, 4>& bounds, int densify_pts) const {
    std::array<double, 4> out{};
    if (!OCTTransformBounds(transform_, bounds[0], bounds[1], bounds[2],
                            bounds[3], &out[0], &out[1], &out[2], &out[3],
                            densify_pts)) {
      throw detail::last_cpl_err(CE_Failure);
    }
    return out;
  }

}  // namespace geobind
