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
#include <geobind/common/version.hpp>

#include <gdal.h>

#include <cstdlib>

namespace geobind {

  std::string version_info(std::string_view key) {
    auto c_key = to_c_string(key);
    return from_c_string(GDALVersionInfo(c_key.c_str()));
  }

  int gdal_version_num() {
    return std::atoi(GDALVersionInfo("VERSION_NUM"));
  }

}  // namespace geobind
