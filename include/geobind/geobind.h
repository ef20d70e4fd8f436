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

#include <geobind/common/borrow.hpp>
#include <geobind/common/common.hpp>
#include <geobind/common/config.hpp>
#include <geobind/common/cpl_string.hpp>
#include <geobind/common/error_handler.hpp>
#include <geobind/common/errors.hpp>
#include <geobind/common/formatters.hpp>
#include <geobind/common/metadata.hpp>
#include <geobind/common/version.hpp>
#include <geobind/io/dataset.hpp>
#include <geobind/io/driver.hpp>
#include <geobind/io/driver_manager.hpp>
#include <geobind/io/vsi.hpp>
#include <geobind/logger/logger.h>
#include <geobind/programs/destination.hpp>
#include <geobind/programs/programs.hpp>
#include <geobind/raster/buffer.hpp>
#include <geobind/raster/gdal_type.hpp>
#include <geobind/raster/geo_transform.hpp>
#include <geobind/raster/raster_band.hpp>
#include <geobind/raster/rasterize.hpp>
#include <geobind/raster/warp.hpp>
#include <geobind/srs/coord_transform.hpp>
#include <geobind/srs/spatial_ref.hpp>
#include <geobind/vector/feature.hpp>
#include <geobind/vector/field.hpp>
#include <geobind/vector/geometry.hpp>
#include <geobind/vector/layer.hpp>
#include <geobind/vector/result_set.hpp>
#include <geobind/vector/transaction.hpp>
