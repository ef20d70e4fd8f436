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


#include <geobind/common/cpl_string.hpp>
#include <geobind/common/errors.hpp>
#include <geobind/io/dataset.hpp>
#include <geobind/io/driver.hpp>
#include <geobind/io/driver_manager.hpp>

#include <fmt/format.h>

#include <climits>

namespace geobind {

  namespace {
    int to_int(std::size_t value, const char* what) {
      if (value > static_cast<std::size_t>(INT_MAX)) {
        throw BadArgumentError(
            fmt::format("{} {} is out of range for GDAL", what, value));
      }
      return static_cast<int>(value);
    }
  }  // namespace

  Driver Driver::from_c_ptr(GDALDriverH driver, const std::string& call) {
    if (driver == nullptr) {
      throw detail::last_null_pointer_err(call);
    }
    return Driver(driver);
  }

  Driver Driver::get_by_name(std::string_view name) {
    DriverManager::ensure_registered();
    auto c_name = to_c_string(name);
    return from_c_ptr(GDALGetDriverByName(c_name.c_str()),
                      "GDALGetDriverByName");
  }

  Driver Driver::get(std::size_t index) {
    DriverManager::ensure_registered();
    return DriverManager::get_driver(index);
  }

  std::string Driver::short_name() const {
    return from_c_string(GDALGetDriverShortName(driver_));
  }

  std::string Driver::long_name() const {
    return from_c_string(GDALGetDriverLongName(driver_));
  }

  Dataset Driver::create(std::string_view filename, std::size_t size_x,
                         std::size_t size_y, std::size_t bands) const {
    return create_with_data_type(filename, size_x, size_y, bands, GDT_Byte,
                                 CslStringList());
  }

  Dataset Driver::create_with_data_type(std::string_view filename,
                                        std::size_t size_x, std::size_t size_y,
                                        std::size_t bands,
                                        GDALDataType data_type,
                                        const CslStringList& options) const {
    auto c_filename = to_c_string(filename);
    GDALDatasetH dataset =
        GDALCreate(driver_, c_filename.c_str(), to_int(size_x, "Width"),
                   to_int(size_y, "Height"), to_int(bands, "Band count"),
                   data_type, options.as_ptr());
    return Dataset::from_c_ptr(dataset, "GDALCreate");
  }

  Dataset Driver::create_vector_only(std::string_view filename) const {
    return create_with_data_type(filename, 0, 0, 0, GDT_Unknown,
                                 CslStringList());
  }

}  // namespace geobind
