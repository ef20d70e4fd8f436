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
#include <geobind/io/driver_manager.hpp>
#include <geobind/logger/logger.h>

#include <gdal.h>

#include <atomic>
#include <climits>
#include <mutex>

namespace geobind {

  namespace {
    std::once_flag registration_once;
    std::atomic<bool> registration_prevented{false};
    std::mutex registry_mutex;
  }  // namespace

  std::size_t DriverManager::count() {
    ensure_registered();
    std::lock_guard<std::mutex> lock(registry_mutex);
    return static_cast<std::size_t>(GDALGetDriverCount());
  }

  Driver DriverManager::get_driver(std::size_t index) {
    ensure_registered();
    std::lock_guard<std::mutex> lock(registry_mutex);
    // GDALGetDriver returns NULL for an index out of range
    int c_index = index > static_cast<std::size_t>(INT_MAX)
                      ? -1
                      : static_cast<int>(index);
    return Driver::from_c_ptr(GDALGetDriver(c_index), "GDALGetDriver");
  }

  std::optional<Driver> DriverManager::get_driver_by_name(
      std::string_view name) {
    auto c_name = to_c_string(name);
    ensure_registered();
    std::lock_guard<std::mutex> lock(registry_mutex);
    GDALDriverH driver = GDALGetDriverByName(c_name.c_str());
    if (driver == nullptr) return std::nullopt;
    return Driver::from_c_ptr(driver);
  }

  std::vector<Driver> DriverManager::drivers() {
    ensure_registered();
    std::lock_guard<std::mutex> lock(registry_mutex);
    std::vector<Driver> result;
    int n = GDALGetDriverCount();
    result.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
      result.push_back(Driver::from_c_ptr(GDALGetDriver(i), "GDALGetDriver"));
    }
    return result;
  }

  std::size_t DriverManager::register_driver(const Driver& driver) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    int index = GDALRegisterDriver(driver.c_ptr());
    logger::Logger::get_logger().debug("Registered driver {} at index {}",
                                       driver.short_name(), index);
    return static_cast<std::size_t>(index);
  }

  void DriverManager::deregister_driver(const Driver& driver) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    GDALDeregisterDriver(driver.c_ptr());
    logger::Logger::get_logger().debug("Deregistered driver {}",
                                       driver.short_name());
  }

  void DriverManager::register_all() {
    std::lock_guard<std::mutex> lock(registry_mutex);
    GDALAllRegister();
    logger::Logger::get_logger().debug("Registered all drivers, {} available",
                                       GDALGetDriverCount());
  }

  void DriverManager::destroy() {
    std::lock_guard<std::mutex> lock(registry_mutex);
    GDALDestroyDriverManager();
    logger::Logger::get_logger().debug("Destroyed the driver manager");
  }

  void DriverManager::prevent_auto_registration() {
    registration_prevented.store(true);
  }

  void DriverManager::ensure_registered() {
    if (registration_prevented.load()) return;
    std::call_once(registration_once, [] {
      if (!registration_prevented.load()) register_all();
    });
  }

}  // namespace geobind
