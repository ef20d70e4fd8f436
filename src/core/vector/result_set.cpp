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


#include <geobind/common/errors.hpp>
#include <geobind/logger/logger.h>
#include <geobind/vector/result_set.hpp>

#include <utility>

namespace geobind {

  ResultSet::~ResultSet() { release_noexcept(); }

  ResultSet::ResultSet(ResultSet&& other) noexcept
      : layer_(std::exchange(other.layer_, nullptr)),
        dataset_(std::exchange(other.dataset_, nullptr)),
        dataset_guard_(std::move(other.dataset_guard_)),
        epoch_(std::move(other.epoch_)) {}

  ResultSet& ResultSet::operator=(ResultSet&& other) noexcept {
    if (this != &other) {
      release_noexcept();
      layer_ = std::exchange(other.layer_, nullptr);
      dataset_ = std::exchange(other.dataset_, nullptr);
      dataset_guard_ = std::move(other.dataset_guard_);
      epoch_ = std::move(other.epoch_);
    }
    return *this;
  }

  void ResultSet::release_noexcept() noexcept {
    if (layer_ == nullptr) return;
    epoch_.advance();
    if (dataset_guard_.is_alive()) {
      GDALDatasetReleaseResultSet(dataset_, layer_);
    } else {
      logger::Logger::get_logger().warning(
          "SQL result set outlived its dataset and was not released");
    }
    layer_ = nullptr;
    dataset_ = nullptr;
  }

  Layer ResultSet::layer() const {
    if (layer_ == nullptr) {
      throw BorrowExpiredError("ResultSet");
    }
    return Layer(layer_, epoch_.issue(), dataset_guard_);
  }

}  // namespace geobind
