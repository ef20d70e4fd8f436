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
#include <utility>
#include <vector>

#include <geobind/common/common.hpp>
#include <geobind/common/errors.hpp>
#include <geobind/raster/gdal_type.hpp>

namespace geobind {

  /**
   * @brief Pixel values in row-major order with their shape as
   * (columns, rows).
   */
  template <GdalPixel T>
  class Buffer {
   public:
    Buffer() = default;

    /** @brief Throws BufferSizeMismatchError if `data` does not fit `shape`. */
    Buffer(Size2 shape, std::vector<T> data)
        : shape_(shape), data_(std::move(data)) {
      if (data_.size() != shape_[0] * shape_[1]) {
        throw BufferSizeMismatchError(shape_[0] * shape_[1], data_.size());
      }
    };

    Buffer(Size2 shape, T fill)
        : shape_(shape), data_(shape[0] * shape[1], fill){};

    const Size2& shape() const { return shape_; };
    std::size_t cols() const { return shape_[0]; };
    std::size_t rows() const { return shape_[1]; };
    std::size_t size() const { return data_.size(); };

    std::vector<T>& data() { return data_; };
    const std::vector<T>& data() const { return data_; };

    T& operator()(std::size_t col, std::size_t row) {
      return data_[row * shape_[0] + col];
    };
    const T& operator()(std::size_t col, std::size_t row) const {
      return data_[row * shape_[0] + col];
    };

    auto begin() { return data_.begin(); };
    auto end() { return data_.end(); };
    auto begin() const { return data_.begin(); };
    auto end() const { return data_.end(); };

    /** @brief Moves the pixel values out, leaving an empty buffer. */
    std::vector<T> into_vec() {
      shape_ = {0, 0};
      return std::move(data_);
    };

   private:
    Size2 shape_ = {0, 0};
    std::vector<T> data_;
  };

}  // namespace geobind
