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

#include <geobind/common/error_handler.hpp>
#include <geobind/logger/logger.h>

#include <cpl_error.h>

#include <memory>
#include <mutex>

namespace geobind {

  namespace {
    std::mutex& handler_mutex() {
      static std::mutex mutex;
      return mutex;
    }

    // Shared so that a handler replaced during a call stays alive until the
    // trampoline is done with it.
    std::shared_ptr<const ErrorHandler>& handler_slot() {
      static std::shared_ptr<const ErrorHandler> slot;
      return slot;
    }

    void CPL_STDCALL error_trampoline(CPLErr err_class, CPLErrorNum err_no,
                                      const char* msg) {
      std::shared_ptr<const ErrorHandler> handler;
      {
        std::lock_guard lock(handler_mutex());
        handler = handler_slot();
      }
      if (!handler) {
        CPLDefaultErrorHandler(err_class, err_no, msg);
        return;
      }
      (*handler)(static_cast<CplErrType>(err_class), static_cast<int>(err_no),
                 msg == nullptr ? std::string_view() : std::string_view(msg));
    }
  }  // namespace

  void set_error_handler(ErrorHandler handler) {
    auto shared = std::make_shared<const ErrorHandler>(std::move(handler));
    {
      std::lock_guard lock(handler_mutex());
      handler_slot() = std::move(shared);
    }
    // GDAL holds its own error mutex while it runs the handler, so it must
    // not be called with ours held.
    CPLSetErrorHandlerEx(error_trampoline, nullptr);
  }

  void remove_error_handler() {
    CPLSetErrorHandler(nullptr);
    std::lock_guard lock(handler_mutex());
    handler_slot().reset();
  }

  void forward_errors_to_logger() {
    set_error_handler([](CplErrType severity, int code, std::string_view msg) {
      auto& logger = logger::Logger::get_logger();
      switch (severity) {
        case CplErrType::None:
        case CplErrType::Debug:
          logger.debug("GDAL: {}", msg);
          break;
        case CplErrType::Warning:
          logger.warning("GDAL warning {}: {}", code, msg);
          break;
        case CplErrType::Failure:
          logger.error("GDAL error {}: {}", code, msg);
          break;
        case CplErrType::Fatal:
          logger.critical("GDAL fatal error {}: {}", code, msg);
          break;
      }
    });
  }

  ScopedQuietErrors::ScopedQuietErrors() {
    CPLPushErrorHandler(CPLQuietErrorHandler);
  }

  ScopedQuietErrors::~ScopedQuietErrors() { CPLPopErrorHandler(); }

}  // namespace geobind
