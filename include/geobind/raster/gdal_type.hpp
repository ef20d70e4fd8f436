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

/**
 * Compile-time mapping between C++ pixel types and GDALDataType.
 *
 * Only the specialisations below exist, so raster I/O with any other element
 * type fails to compile.
 */
#pragma once

#include <complex>
#include <concepts>
#include <cstdint>
#include <string>

#include <gdal.h>
#include <gdal_version.h>

namespace geobind {

  template <typename T>
  struct GdalType;

  template <>
  struct GdalType<std::uint8_t> {
    static constexpr GDALDataType datatype = GDT_Byte;
  };
#if GDAL_VERSION_NUM >= GDAL_COMPUTE_VERSION(3, 7, 0)
  template <>
  struct GdalType<std::int8_t> {
    static constexpr GDALDataType datatype = GDT_Int8;
  };
#endif
  template <>
  struct GdalType<std::uint16_t> {
    static constexpr GDALDataType datatype = GDT_UInt16;
  };
  template <>
  struct GdalType<std::int16_t> {
    static constexpr GDALDataType datatype = GDT_Int16;
  };
  template <>
  struct GdalType<std::uint32_t> {
    static constexpr GDALDataType datatype = GDT_UInt32;
  };
  template <>
  struct GdalType<std::int32_t> {
    static constexpr GDALDataType datatype = GDT_Int32;
  };
#if GDAL_VERSION_NUM >= GDAL_COMPUTE_VERSION(3, 5, 0)
  template <>
  struct GdalType<std::uint64_t> {
    static constexpr GDALDataType datatype = GDT_UInt64;
  };
  template <>
  struct GdalType<std::int64_t> {
    static constexpr GDALDataType datatype = GDT_Int64;
  };
#endif
  template <>
  struct GdalType<float> {
    static constexpr GDALDataType datatype = GDT_Float32;
  };
  template <>
  struct GdalType<double> {
    static constexpr GDALDataType datatype = GDT_Float64;
  };
  template <>
  struct GdalType<std::complex<float>> {
    static constexpr GDALDataType datatype = GDT_CFloat32;
  };
  template <>
  struct GdalType<std::complex<double>> {
    static constexpr GDALDataType datatype = GDT_CFloat64;
  };

  template <typename T>
  concept GdalPixel = requires {
    { GdalType<T>::datatype } -> std::convertible_to<GDALDataType>;
  };

  /** @brief GDAL's name of a data type, eg. "Byte" or "Float32". */
  std::string data_type_name(GDALDataType data_type);

  /** @brief Size of one pixel of `data_type` in bytes, 0 for GDT_Unknown. */
  int data_type_size_bytes(GDALDataType data_type);

}  // namespace geobind
