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

#include <geobind/common/borrow.hpp>
#include <geobind/common/errors.hpp>

#include <cpl_error.h>
#include <fmt/format.h>

#include <utility>

namespace geobind {

  const char* to_string(CplErrType severity) {
    switch (severity) {
      case CplErrType::None:
        return "None";
      case CplErrType::Debug:
        return "Debug";
      case CplErrType::Warning:
        return "Warning";
      case CplErrType::Failure:
        return "Failure";
      case CplErrType::Fatal:
        return "Fatal";
    }
    return "Unknown";
  }

  NullPointerError::NullPointerError(std::string call, std::string message)
      : GeobindError(fmt::format(
            "GDAL method '{}' returned a NULL pointer. Error msg: '{}'", call,
            message)),
        call_(std::move(call)),
        message_(std::move(message)) {}

  NativeError::NativeError(CplErrType severity, int code, std::string message)
      : GeobindError(fmt::format(
            "CPL error class: '{}', error number: '{}', error msg: '{}'",
            to_string(severity), code, message)),
        severity_(severity),
        code_(code),
        message_(std::move(message)) {}

  OgrError::OgrError(int err, std::string call)
      : GeobindError(fmt::format("OGR method '{}' returned error: '{}'", call,
                                 err)),
        err_(err),
        call_(std::move(call)) {}

  InvalidFieldTypeError::InvalidFieldTypeError(std::string field,
                                               std::string expected,
                                               std::string actual)
      : GeobindError(
            fmt::format("Field '{}' has type '{}', a value of type '{}' was "
                        "given",
                        field, expected, actual)),
        field_(std::move(field)),
        expected_(std::move(expected)),
        actual_(std::move(actual)) {}

  UnhandledFieldTypeError::UnhandledFieldTypeError(int field_type,
                                                   std::string call)
      : GeobindError(fmt::format("Unhandled field type '{}' in method '{}'",
                                 field_type, call)),
        field_type_(field_type) {}

  InvalidFieldNameError::InvalidFieldNameError(std::string field_name,
                                               std::string call)
      : GeobindError(fmt::format("Invalid field name '{}' used on method '{}'",
                                 field_name, call)),
        field_name_(std::move(field_name)) {}

  InvalidFieldIndexError::InvalidFieldIndexError(std::size_t index,
                                                 std::string call)
      : GeobindError(fmt::format("Invalid field index '{}' used on method '{}'",
                                 index, call)),
        index_(index) {}

  StringConversionError::StringConversionError(const std::string& text)
      : GeobindError(fmt::format(
            "Cannot pass string with an embedded NUL byte to GDAL: '{}'",
            text.substr(0, text.find('\0')))) {}

  InvalidCoordinateRangeError::InvalidCoordinateRangeError(std::string from,
                                                           std::string to,
                                                           std::string message)
      : GeobindError(fmt::format(
            "Unable to transform coordinates from '{}' to '{}': {}", from, to,
            message)),
        from_(std::move(from)),
        to_(std::move(to)) {}

  BufferSizeMismatchError::BufferSizeMismatchError(std::size_t expected,
                                                   std::size_t actual)
      : GeobindError(fmt::format(
            "Buffer holds {} elements, its shape requires {}", actual,
            expected)),
        expected_(expected),
        actual_(actual) {}

  BorrowExpiredError::BorrowExpiredError(const std::string& what)
      : GeobindError(fmt::format(
            "{} was used after the object it was obtained from was closed",
            what)) {}

  void BorrowGuard::check(const char* what) const {
    if (!is_alive()) throw BorrowExpiredError(what);
  }

  namespace detail {
    NativeError last_cpl_err(int status) {
      int code = CPLGetLastErrorNo();
      std::string message = CPLGetLastErrorMsg();
      CPLErrorReset();
      return NativeError(static_cast<CplErrType>(status), code,
                         std::move(message));
    }

    NullPointerError last_null_pointer_err(const std::string& call) {
      std::string message = CPLGetLastErrorMsg();
      CPLErrorReset();
      return NullPointerError(call, std::move(message));
    }
  }  // namespace detail

}  // namespace geobind
