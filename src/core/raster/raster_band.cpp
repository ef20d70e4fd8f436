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
#include <geobind/raster/raster_band.hpp>

#include <fmt/format.h>

#include <climits>

namespace geobind {

  namespace {
    int to_int(std::int64_t value, const char* what) {
      if (value < INT_MIN || value > INT_MAX) {
        throw BadArgumentError(
            fmt::format("{} {} is out of range for GDAL", what, value));
      }
      return static_cast<int>(value);
    }

    int to_int(std::size_t value, const char* what) {
      if (value > static_cast<std::size_t>(INT_MAX)) {
        throw BadArgumentError(
            fmt::format("{} {} is out of range for GDAL", what, value));
      }
      return static_cast<int>(value);
    }
  }  // namespace

  std::string data_type_name(GDALDataType data_type) {
    return from_c_string(GDALGetDataTypeName(data_type));
  }

  int data_type_size_bytes(GDALDataType data_type) {
    return GDALGetDataTypeSizeBytes(data_type);
  }

  std::string color_interpretation_name(ColorInterpretation interpretation) {
    return from_c_string(GDALGetColorInterpretationName(
        static_cast<GDALColorInterp>(interpretation)));
  }

  std::optional<ColorInterpretation> color_interpretation_from_name(
      std::string_view name) {
    auto c_name = to_c_string(name);
    GDALColorInterp interp = GDALGetColorInterpretationByName(c_name.c_str());
    // unknown names map to GCI_Undefined
    if (interp == GCI_Undefined && name != "Undefined") return std::nullopt;
    return static_cast<ColorInterpretation>(interp);
  }

  GDALRasterBandH RasterBand::c_ptr() const {
    guard_.check("RasterBand");
    return band_;
  }

  std::size_t RasterBand::x_size() const {
    return static_cast<std::size_t>(GDALGetRasterBandXSize(c_ptr()));
  }

  std::size_t RasterBand::y_size() const {
    return static_cast<std::size_t>(GDALGetRasterBandYSize(c_ptr()));
  }

  Size2 RasterBand::size() const { return {x_size(), y_size()}; }

  Size2 RasterBand::block_size() const {
    int x = 0, y = 0;
    GDALGetBlockSize(c_ptr(), &x, &y);
    return {static_cast<std::size_t>(x), static_cast<std::size_t>(y)};
  }

  Size2 RasterBand::actual_block_size(std::size_t block_x,
                                      std::size_t block_y) const {
    int x = 0, y = 0;
    CPLErr rv =
        GDALGetActualBlockSize(c_ptr(), to_int(block_x, "Block column"),
                               to_int(block_y, "Block row"), &x, &y);
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
    return {static_cast<std::size_t>(x), static_cast<std::size_t>(y)};
  }

  GDALDataType RasterBand::band_type() const {
    return GDALGetRasterDataType(c_ptr());
  }

  std::optional<double> RasterBand::no_data_value() const {
    int has_value = 0;
    double value = GDALGetRasterNoDataValue(c_ptr(), &has_value);
    if (!has_value) return std::nullopt;
    return value;
  }

  void RasterBand::set_no_data_value(std::optional<double> no_data) {
    CPLErr rv = no_data ? GDALSetRasterNoDataValue(c_ptr(), *no_data)
                        : GDALDeleteRasterNoDataValue(c_ptr());
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
  }

  std::optional<double> RasterBand::scale() const {
    int has_value = 0;
    double value = GDALGetRasterScale(c_ptr(), &has_value);
    if (!has_value) return std::nullopt;
    return value;
  }

  void RasterBand::set_scale(double scale) {
    CPLErr rv = GDALSetRasterScale(c_ptr(), scale);
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
  }

  std::optional<double> RasterBand::offset() const {
    int has_value = 0;
    double value = GDALGetRasterOffset(c_ptr(), &has_value);
    if (!has_value) return std::nullopt;
    return value;
  }

  void RasterBand::set_offset(double offset) {
    CPLErr rv = GDALSetRasterOffset(c_ptr(), offset);
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
  }

  std::string RasterBand::unit() const {
    return from_c_string(GDALGetRasterUnitType(c_ptr()));
  }

  void RasterBand::set_unit(std::string_view unit) {
    auto c_unit = to_c_string(unit);
    CPLErr rv = GDALSetRasterUnitType(c_ptr(), c_unit.c_str());
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
  }

  ColorInterpretation RasterBand::color_interpretation() const {
    return static_cast<ColorInterpretation>(
        GDALGetRasterColorInterpretation(c_ptr()));
  }

  void RasterBand::set_color_interpretation(
      ColorInterpretation interpretation) {
    CPLErr rv = GDALSetRasterColorInterpretation(
        c_ptr(), static_cast<GDALColorInterp>(interpretation));
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
  }

  std::size_t RasterBand::overview_count() const {
    return static_cast<std::size_t>(GDALGetOverviewCount(c_ptr()));
  }

  RasterBand RasterBand::overview(std::size_t index) const {
    GDALRasterBandH overview =
        GDALGetOverview(c_ptr(), to_int(index, "Overview index"));
    if (overview == nullptr) {
      throw detail::last_null_pointer_err("GDALGetOverview");
    }
    // overviews live as long as the dataset of the parent band
    return RasterBand(overview, guard_);
  }

  void RasterBand::fill(double real_value, double imaginary_value) {
    CPLErr rv = GDALFillRaster(c_ptr(), real_value, imaginary_value);
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
  }

  void RasterBand::raster_io(GDALRWFlag flag, Offset2 window,
                             Size2 window_size, Size2 size, void* data,
                             GDALDataType data_type,
                             std::optional<ResampleAlg> resample) const {
    if (window_size[0] == 0 || window_size[1] == 0) {
      throw BadArgumentError(fmt::format("Window size {}x{} is empty",
                                         window_size[0], window_size[1]));
    }
    if (size[0] == 0 || size[1] == 0) {
      throw BadArgumentError(
          fmt::format("Buffer size {}x{} is empty", size[0], size[1]));
    }

    GDALRasterIOExtraArg extra_arg;
    INIT_RASTERIO_EXTRA_ARG(extra_arg);
    if (resample) {
      extra_arg.eResampleAlg = static_cast<GDALRIOResampleAlg>(*resample);
    }

    CPLErr rv = GDALRasterIOEx(
        c_ptr(), flag, to_int(window[0], "Window x offset"),
        to_int(window[1], "Window y offset"),
        to_int(window_size[0], "Window width"),
        to_int(window_size[1], "Window height"), data,
        to_int(size[0], "Buffer width"), to_int(size[1], "Buffer height"),
        data_type, 0, 0, &extra_arg);
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
  }

  void RasterBand::read_block_into(std::size_t block_x, std::size_t block_y,
                                   void* data, GDALDataType data_type) const {
    if (data_type != band_type()) {
      throw BadArgumentError(fmt::format(
          "Block of {} band requested as {}", data_type_name(band_type()),
          data_type_name(data_type)));
    }
    CPLErr rv = GDALReadBlock(c_ptr(), to_int(block_x, "Block column"),
                              to_int(block_y, "Block row"), data);
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
  }

}  // namespace geobind
