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

/**
 * spdlog logging backend implementation.
 * Logs messages to stdout, stderr and optionally a JSON lines file.
 */
#include <geobind/logger/logger.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace geobind::logger {

  namespace {
    spdlog::level::level_enum cast_level(LogLevel level) {
      switch (level) {
        case LogLevel::off:
          return spdlog::level::off;
        case LogLevel::trace:
          return spdlog::level::trace;
        case LogLevel::debug:
          return spdlog::level::debug;
        case LogLevel::info:
          return spdlog::level::info;
        case LogLevel::warning:
          return spdlog::level::warn;
        case LogLevel::error:
          return spdlog::level::err;
        case LogLevel::critical:
          return spdlog::level::critical;
      }
      return spdlog::level::off;
    }

    const char* jsonpattern =
        R"({"time": "%Y-%m-%dT%H:%M:%S.%f%z", "name": "%n", "level": "%l", "process": %P, "thread": %t, "message": "%v"})";
  }  // namespace

  struct Logger::logger_impl {
    std::mutex mutex;
    LogLevel level = LogLevel::default_level;

    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> stdout_sink =
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> stderr_sink =
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;

    spdlog::logger logger_stdout = spdlog::logger("stdout", stdout_sink);
    spdlog::logger logger_stderr = spdlog::logger("stderr", stderr_sink);

    logger_impl() { set_level(level); }

    ~logger_impl() {
      logger_stdout.flush();
      logger_stderr.flush();
    }

    void set_level(LogLevel new_level) {
      level = new_level;
      auto spdlog_level = cast_level(new_level);
      stdout_sink->set_level(spdlog_level);
      stderr_sink->set_level(spdlog_level);
      if (file_sink) file_sink->set_level(spdlog_level);
      logger_stdout.set_level(spdlog_level);
      logger_stderr.set_level(spdlog_level);
    }

    void set_logfile(const std::string& path) {
      auto& out_sinks = logger_stdout.sinks();
      auto& err_sinks = logger_stderr.sinks();
      if (file_sink) {
        std::erase(out_sinks, file_sink);
        std::erase(err_sinks, file_sink);
      }
      file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
      file_sink->set_pattern(jsonpattern);
      file_sink->set_level(cast_level(level));
      out_sinks.push_back(file_sink);
      err_sinks.push_back(file_sink);
    }
  };

  void Logger::set_level(LogLevel level) {
    std::lock_guard lock(impl_->mutex);
    impl_->set_level(level);
  }

  LogLevel Logger::level() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->level;
  }

  void Logger::set_logfile(const std::string& path) {
    std::lock_guard lock(impl_->mutex);
    impl_->set_logfile(path);
  }

  void Logger::flush() {
    std::lock_guard lock(impl_->mutex);
    impl_->logger_stdout.flush();
    impl_->logger_stderr.flush();
  }

  Logger& Logger::get_logger() {
    static Logger singleton;
    static std::once_flag init;
    std::call_once(init, [] {
      singleton.impl_ = std::make_shared<Logger::logger_impl>();
    });
    return singleton;
  }

  void Logger::log(LogLevel level, std::string_view message) {
    switch (level) {
      case LogLevel::off:
        return;
      case LogLevel::trace:
        impl_->logger_stdout.trace(message);
        return;
      case LogLevel::debug:
        impl_->logger_stdout.debug(message);
        return;
      case LogLevel::info:
        impl_->logger_stdout.info(message);
        return;
      case LogLevel::warning:
        impl_->logger_stdout.warn(message);
        return;
      case LogLevel::error:
        impl_->logger_stderr.error(message);
        return;
      case LogLevel::critical:
        impl_->logger_stderr.critical(message);
        return;
    }
  }

}  // namespace geobind::logger
