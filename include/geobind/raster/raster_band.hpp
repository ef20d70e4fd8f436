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
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <gdal.h>

#include <geobind/common/borrow.hpp>
#include <geobind/common/common.hpp>
#include <geobind/common/errors.hpp>
#include <geobind/common/metadata.hpp>
#include <geobind/raster/buffer.hpp>
#include <geobind/raster/gdal_type.hpp>

namespace geobind {

  /** @brief Resampling used when a window is read into a buffer of another
   * size. */
  enum class ResampleAlg {
    NearestNeighbour = GRIORA_NearestNeighbour,
    Bilinear = GRIORA_Bilinear,
    Cubic = GRIORA_Cubic,
    CubicSpline = GRIORA_CubicSpline,
    Lanczos = GRIORA_Lanczos,
    Average = GRIORA_Average,
    Mode = GRIORA_Mode,
    Gauss = GRIORA_Gauss,
  };

  enum class ColorInterpretation {
    Undefined = GCI_Undefined,
    GrayIndex = GCI_GrayIndex,
    PaletteIndex = GCI_PaletteIndex,
    RedBand = GCI_RedBand,
    GreenBand = GCI_GreenBand,
    BlueBand = GCI_BlueBand,
    AlphaBand = GCI_AlphaBand,
    HueBand = GCI_HueBand,
    SaturationBand = GCI_SaturationBand,
    LightnessBand = GCI_LightnessBand,
    CyanBand = GCI_CyanBand,
    MagentaBand = GCI_MagentaBand,
    YellowBand = GCI_YellowBand,
    BlackBand = GCI_BlackBand,
    YCbCrSpaceYBand = GCI_YCbCr_YBand,
    YCbCrSpaceCbBand = GCI_YCbCr_CbBand,
    YCbCrSpaceCrBand = GCI_YCbCr_CrBand,
  };

  /** @brief GDAL's name, eg. "Red" for RedBand. */
  std::string color_interpretation_name(ColorInterpretation interpretation);
  /** @brief Inverse of color_interpretation_name, nullopt for unknown names. */
  std::optional<ColorInterpretation> color_interpretation_from_name(
      std::string_view name);

  /**
   * @brief A band of a Dataset, or an overview of such a band.
   *
   * Views only. Every call checks that the dataset the band came from is
   * still open and throws BorrowExpiredError otherwise.
   */
  class RasterBand : public MetadataInterface {
   public:
    RasterBand(GDALRasterBandH band, BorrowGuard guard)
        : band_(band), guard_(std::move(guard)){};

    GDALRasterBandH c_ptr() const;
    GDALMajorObjectH major_object_ptr() const override { return c_ptr(); }

    std::size_t x_size() const;
    std::size_t y_size() const;
    Size2 size() const;
    /** @brief Natural block size, eg. one strip of a striped GeoTIFF. */
    Size2 block_size() const;
    /** @brief Valid part of block (x, y), smaller than block_size() at the
     * right and bottom edges. */
    Size2 actual_block_size(std::size_t block_x, std::size_t block_y) const;

    GDALDataType band_type() const;

    std::optional<double> no_data_value() const;
    /** @brief Sets the no-data value, nullopt removes it. */
    void set_no_data_value(std::optional<double> no_data);

    std::optional<double> scale() const;
    void set_scale(double scale);
    std::optional<double> offset() const;
    void set_offset(double offset);

    std::string unit() const;
    void set_unit(std::string_view unit);

    ColorInterpretation color_interpretation() const;
    void set_color_interpretation(ColorInterpretation interpretation);

    std::size_t overview_count() const;
    /** @brief Overview `index`, 0-based, of this band. */
    RasterBand overview(std::size_t index) const;

    /**
     * @brief Reads the window at `window` of `window_size` pixels into a
     * buffer of `size` pixels. GDAL resamples with `resample` when the two
     * sizes differ.
     */
    template <GdalPixel T>
    Buffer<T> read_as(Offset2 window, Size2 window_size, Size2 size,
                      std::optional<ResampleAlg> resample = std::nullopt) const;

    /** @brief As read_as, into caller memory of `size[0] * size[1]` values. */
    template <GdalPixel T>
    void read_into(Offset2 window, Size2 window_size, Size2 size,
                   std::span<T> buffer,
                   std::optional<ResampleAlg> resample = std::nullopt) const;

    /** @brief Reads the whole band at its own size. */
    template <GdalPixel T>
    Buffer<T> read_band_as() const;

    /**
     * @brief Reads block (x, y). `T` must be the band's own type, the buffer
     * has the full block size, pixels past actual_block_size() are undefined.
     */
    template <GdalPixel T>
    Buffer<T> read_block(std::size_t block_x, std::size_t block_y) const;

    /**
     * @brief Writes `buffer` to the window at `window` of `window_size`
     * pixels. The band keeps its type, GDAL converts the values, clamping and
     * rounding as needed.
     */
    template <GdalPixel T>
    void write(Offset2 window, Size2 window_size, const Buffer<T>& buffer);

    void fill(double real_value, double imaginary_value = 0);

   private:
    void raster_io(GDALRWFlag flag, Offset2 window, Size2 window_size,
                   Size2 size, void* data, GDALDataType data_type,
                   std::optional<ResampleAlg> resample) const;
    void read_block_into(std::size_t block_x, std::size_t block_y, void* data,
                         GDALDataType data_type) const;

    GDALRasterBandH band_;
    BorrowGuard guard_;
  };

  template <GdalPixel T>
  void RasterBand::read_into(Offset2 window, Size2 window_size, Size2 size,
                             std::span<T> buffer,
                             std::optional<ResampleAlg> resample) const {
    if (buffer.size() != size[0] * size[1]) {
      throw BufferSizeMismatchError(size[0] * size[1], buffer.size());
    }
    raster_io(GF_Read, window, window_size, size, buffer.data(),
              GdalType<T>::datatype, resample);
  }

  template <GdalPixel T>
  Buffer<T> RasterBand::read_as(Offset2 window, Size2 window_size, Size2 size,
                                std::optional<ResampleAlg> resample) const {
    Buffer<T> buffer(size, T{});
    read_into<T>(window, window_size, size, std::span<T>(buffer.data()),
                 resample);
    return buffer;
  }

  template <GdalPixel T>
  Buffer<T> RasterBand::read_band_as() const {
    auto band_size = size();
    return read_as<T>({0, 0}, band_size, band_size);
  }

  template <GdalPixel T>
  Buffer<T> RasterBand::read_block(std::size_t block_x,
                                   std::size_t block_y) const {
    Buffer<T> buffer(block_size(), T{});
    read_block_into(block_x, block_y, buffer.data().data(),
                    GdalType<T>::datatype);
    return buffer;
  }

  template <GdalPixel T>
  void RasterBand::write(Offset2 window, Size2 window_size,
                         const Buffer<T>& buffer) {
    // GDALRasterIO takes a non-const pointer for both directions
    raster_io(GF_Write, window, window_size, buffer.shape(),
              const_cast<T*>(buffer.data().data()), GdalType<T>::datatype,
              std::nullopt);
  }

}  // namespace geobind
