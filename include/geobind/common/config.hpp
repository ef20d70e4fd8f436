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
// Balazs Dukai

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <geobind/logger/logger.h>

namespace geobind {

  /**
   * @brief Sets a GDAL config option (see
   * https://gdal.org/user/configoptions.html). Options set here override the
   * environment.
   */
  void set_config_option(std::string_view key, std::string_view value);

  /** @brief Value of a GDAL config option, or `default_value` if unset. */
  std::string get_config_option(std::string_view key,
                                std::string_view default_value);

  void clear_config_option(std::string_view key);

  void set_thread_local_config_option(std::string_view key,
                                      std::string_view value);
  std::string get_thread_local_config_option(std::string_view key,
                                             std::string_view default_value);
  void clear_thread_local_config_option(std::string_view key);

  /**
   * @brief Runtime settings applied once by the embedding program with
   * configure().
   */
  struct RuntimeConfig {
    /**
     * @brief Minimum level of messages written by logger::Logger.
     */
    logger::LogLevel log_level = logger::LogLevel::default_level;
    /**
     * @brief If set, log records are also written to this file as JSON
     * lines. An existing file is truncated.
     */
    std::optional<std::string> log_file;
    /**
     * @brief Install an error handler that forwards every GDAL error report to
     * the logger.
     */
    bool log_native_errors = false;
    /**
     * @brief Register all drivers on the first Dataset open. Set to false when
     * the program registers drivers itself through DriverManager.
     */
    bool auto_register_drivers = true;
    /**
     * @brief GDAL config options, eg. {"GDAL_CACHEMAX", "128"}.
     */
    std::map<std::string, std::string> config_options;

    bool is_valid() const;
  };

  /** @brief Applies `cfg`, throws BadArgumentError if it is not valid. */
  void configure(const RuntimeConfig& cfg);

}  // namespace geobind
