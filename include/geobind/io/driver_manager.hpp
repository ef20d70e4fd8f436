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

/**
 * Process-wide driver registry.
 *
 * The first Dataset open registers every driver GDAL was built with, exactly
 * once even when several threads open their first dataset at the same time.
 * The manual calls below take a registry mutex each, but GDAL's driver table
 * itself has no lock that covers opens on other threads. Do not mix them with
 * concurrent opens.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include <geobind/io/driver.hpp>

namespace geobind {

  class DriverManager {
   public:
    DriverManager() = delete;

    /** @brief Number of registered drivers. */
    static std::size_t count();

    /** @brief Registered driver at `index`, NullPointerError if out of range. */
    static Driver get_driver(std::size_t index);

    /** @brief Registered driver named `name`, nullopt if there is none. */
    static std::optional<Driver> get_driver_by_name(std::string_view name);

    static std::vector<Driver> drivers();

    /** @brief Adds `driver` to the table, returns its index. */
    static std::size_t register_driver(const Driver& driver);

    /** @brief Removes `driver` from the table without destroying it. */
    static void deregister_driver(const Driver& driver);

    /** @brief Registers every available driver. Safe to call repeatedly. */
    static void register_all();

    /**
     * @brief Destroys every driver and resets GDAL's global state. Open
     * datasets must be closed first.
     */
    static void destroy();

    /**
     * @brief Stops the first Dataset open from registering all drivers. Has
     * no effect once that registration happened.
     */
    static void prevent_auto_registration();

    /** @brief Performs the one-time registration unless it was prevented. */
    static void ensure_registered();
  };

}  // namespace geobind
