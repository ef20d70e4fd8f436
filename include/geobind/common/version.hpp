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

namespace geobind {

  /**
   * @brief GDALVersionInfo for `key`, eg. "VERSION_NUM", "RELEASE_DATE",
   * "RELEASE_NAME", "--version" or "BUILD_INFO".
   */
  std::string version_info(std::string_view key);

  /** @brief GDAL_VERSION_NUM of the library loaded at run time. */
  int gdal_version_num();

}  // namespace geobind
