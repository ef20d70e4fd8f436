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

#include <geobind/common/config.hpp>
#include <geobind/common/cpl_string.hpp>
#include <geobind/common/error_handler.hpp>
#include <geobind/common/errors.hpp>
#include <geobind/io/driver_manager.hpp>

#include <cpl_conv.h>

namespace geobind {

  void set_config_option(std::string_view key, std::string_view value) {
    auto c_key = to_c_string(key);
    auto c_value = to_c_string(value);
    CPLSetConfigOption(c_key.c_str(), c_value.c_str());
  }

  std::string get_config_option(std::string_view key,
                                std::string_view default_value) {
    auto c_key = to_c_string(key);
    auto c_default = to_c_string(default_value);
    return from_c_string(CPLGetConfigOption(c_key.c_str(), c_default.c_str()));
  }

  void clear_config_option(std::string_view key) {
    auto c_key = to_c_string(key);
    CPLSetConfigOption(c_key.c_str(), nullptr);
  }

  void set_thread_local_config_option(std::string_view key,
                                      std::string_view value) {
    auto c_key = to_c_string(key);
    auto c_value = to_c_string(value);
    CPLSetThreadLocalConfigOption(c_key.c_str(), c_value.c_str());
  }

  std::string get_thread_local_config_option(std::string_view key,
                                             std::string_view default_value) {
    auto c_key = to_c_string(key);
    auto c_default = to_c_string(default_value);
    return from_c_string(
        CPLGetThreadLocalConfigOption(c_key.c_str(), c_default.c_str()));
  }

  void clear_thread_local_config_option(std::string_view key) {
    auto c_key = to_c_string(key);
    CPLSetThreadLocalConfigOption(c_key.c_str(), nullptr);
  }

  bool RuntimeConfig::is_valid() const {
    if (log_file && log_file->empty()) return false;
    for (const auto& [key, value] : config_options) {
      if (key.empty()) return false;
      if (key.find_first_of(std::string("=\0", 2)) != std::string::npos)
        return false;
      if (value.find('\0') != std::string::npos) return false;
    }
    return true;
  }

  void configure(const RuntimeConfig& cfg) {
    if (!cfg.is_valid()) {
      throw BadArgumentError("Invalid runtime configuration");
    }
    auto& logger = logger::Logger::get_logger();
    logger.set_level(cfg.log_level);
    if (cfg.log_file) {
      logger.set_logfile(*cfg.log_file);
    }
    for (const auto& [key, value] : cfg.config_options) {
      set_config_option(key, value);
      logger.debug("Config option {}={}", key, value);
    }
    if (cfg.log_native_errors) {
      forward_errors_to_logger();
    }
    if (!cfg.auto_register_drivers) {
      DriverManager::prevent_auto_registration();
    }
  }

}  // namespace geobind
