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
#include <geobind/programs/destination.hpp>

#include <utility>

namespace geobind {

  DatasetDestination DatasetDestination::path(std::string_view path) {
    return DatasetDestination(to_c_string(path));
  }

  DatasetDestination DatasetDestination::dataset(Dataset dataset) {
    return DatasetDestination(std::move(dataset));
  }

  const std::string* DatasetDestination::path_ptr() const {
    return std::get_if<std::string>(&target_);
  }

  Dataset* DatasetDestination::dataset_ptr() {
    return std::get_if<Dataset>(&target_);
  }

}  // namespace geobind
