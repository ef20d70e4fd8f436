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
 * Process-wide GDAL error callback.
 *
 * GDAL reports errors through one global handler. geobind keeps the
 * installed callback in a mutex-guarded slot and registers a single trampoline
 * with CPLSetErrorHandlerEx. A callback that is replaced while it runs stays
 * alive until it returns. When two threads install a handler at the same
 * time, either one may end up active.
 */
#pragma once

#include <functional>
#include <string>
#include <string_view>

#include <geobind/common/errors.hpp>

namespace geobind {

  struct ErrorRecord {
    CplErrType severity = CplErrType::None;
    int code = 0;
    std::string message;
    bool operator==(const ErrorRecord&) const = default;
  };

  typedef std::function<void(CplErrType, int, std::string_view)> ErrorHandler;

  /** @brief Installs `handler` for every error GDAL reports, in order. */
  void set_error_handler(ErrorHandler handler);

  /** @brief Restores GDAL's default handler. */
  void remove_error_handler();

  /**
   * @brief Installs a handler that forwards GDAL errors to
   * logger::Logger, debug messages at debug level, warnings at warning
   * level and failures at error level.
   */
  void forward_errors_to_logger();

  /**
   * @brief Silences GDAL error output for the lifetime of the object.
   *
   * Pushes CPLQuietErrorHandler on the calling thread's handler stack, the
   * CPL error state is still set so failures are reported as exceptions.
   */
  class ScopedQuietErrors {
   public:
    ScopedQuietErrors();
    ~ScopedQuietErrors();
    ScopedQuietErrors(const ScopedQuietErrors&) = delete;
    ScopedQuietErrors& operator=(const ScopedQuietErrors&) = delete;
  };

}  // namespace geobind
