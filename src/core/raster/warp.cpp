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

#include <geobind/common/errors.hpp>
#include <geobind/io/dataset.hpp>
#include <geobind/logger/logger.h>
#include <geobind/raster/warp.hpp>

namespace geobind {

  void reproject(const Dataset& source, Dataset& destination,
                 WarpResampleAlg resample, double max_error) {
    CPLErr rv = GDALReprojectImage(
        source.c_ptr(), nullptr, destination.c_ptr(), nullptr,
        static_cast<GDALResampleAlg>(resample), 0.0, max_error, nullptr,
        nullptr, nullptr);
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
    logger::Logger::get_logger().debug("Reprojected {} into {}",
                                       source.description(),
                                       destination.description());
  }

}  // namespace geobind
