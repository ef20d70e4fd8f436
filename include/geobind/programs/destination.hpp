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

#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <geobind/io/dataset.hpp>

namespace geobind {

  /**
   * @brief Where a GDAL program writes its output: a new dataset at a path,
   * or an open dataset that the program takes over when it succeeds.
   */
  class DatasetDestination {
   public:
    static DatasetDestination path(std::string_view path);
    static DatasetDestination dataset(Dataset dataset);

    DatasetDestination(DatasetDestination&&) noexcept = default;
    DatasetDestination& operator=(DatasetDestination&&) noexcept = default;
    DatasetDestination(const DatasetDestination&) = delete;
    DatasetDestination& operator=(const DatasetDestination&) = delete;

    /** @brief The output path, NULL for a dataset destination. */
    const std::string* path_ptr() const;
    /** @brief The output dataset, NULL for a path destination. */
    Dataset* dataset_ptr();

   private:
    explicit DatasetDestination(std::variant<std::string, Dataset> target)
        : target_(std::move(target)){};

    // a dataset still held here when the destination dies is closed with it
    std::variant<std::string, Dataset> target_;
  };

}  // namespace geobind
