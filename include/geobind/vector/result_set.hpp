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


#pragma once

#include <utility>

#include <gdal.h>
#include <ogr_api.h>

#include <geobind/common/borrow.hpp>
#include <geobind/vector/layer.hpp>

namespace geobind {

  /**
   * @brief Owns the layer produced by Dataset::execute_sql.
   *
   * The result set is handed back to its dataset when destroyed. If the
   * dataset was closed first the result set cannot be released anymore, this
   * is logged as a warning.
   */
  class ResultSet {
   public:
    ResultSet(OGRLayerH layer, GDALDatasetH dataset, BorrowGuard dataset_guard)
        : layer_(layer),
          dataset_(dataset),
          dataset_guard_(std::move(dataset_guard)){};
    ~ResultSet();
    ResultSet(ResultSet&& other) noexcept;
    ResultSet& operator=(ResultSet&& other) noexcept;
    ResultSet(const ResultSet&) = delete;
    ResultSet& operator=(const ResultSet&) = delete;

    /** @brief The rows as a layer, valid while this result set lives. */
    Layer layer() const;

   private:
    void release_noexcept() noexcept;

    OGRLayerH layer_ = nullptr;
    GDALDatasetH dataset_ = nullptr;
    BorrowGuard dataset_guard_;
    Epoch epoch_;
  };

}  // namespace geobind
