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
 * Exceptions thrown by geobind.
 *
 * Every fallible call checks the native return value right away and throws one
 * of the types below. They all derive from GeobindError, which is a
 * std::runtime_error, so a caller that does not care about the failure kind
 * can catch that.
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace geobind {

  /** @brief Severity of a CPL error report. Values match CPLErr. */
  enum class CplErrType : int {
    None = 0,
    Debug = 1,
    Warning = 2,
    Failure = 3,
    // GDAL may terminate the process after reporting a fatal error, there is
    // no recovery from this class.
    Fatal = 4,
  };

  const char* to_string(CplErrType severity);

  class GeobindError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
  };

  /** @brief A native call returned NULL. */
  class NullPointerError : public GeobindError {
   public:
    NullPointerError(std::string call, std::string message);
    const std::string& call() const { return call_; }
    const std::string& message() const { return message_; }

   private:
    std::string call_;
    std::string message_;
  };

  /** @brief The CPL error state held a specific report for a failed call. */
  class NativeError : public GeobindError {
   public:
    NativeError(CplErrType severity, int code, std::string message);
    CplErrType severity() const { return severity_; }
    int code() const { return code_; }
    const std::string& message() const { return message_; }

   private:
    CplErrType severity_;
    int code_;
    std::string message_;
  };

  /** @brief An OGR call returned a non-zero OGRErr. */
  class OgrError : public GeobindError {
   public:
    OgrError(int err, std::string call);
    int err() const { return err_; }
    const std::string& call() const { return call_; }

   private:
    int err_;
    std::string call_;
  };

  class InvalidFieldTypeError : public GeobindError {
   public:
    InvalidFieldTypeError(std::string field, std::string expected,
                          std::string actual);
    const std::string& field() const { return field_; }
    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

   private:
    std::string field_;
    std::string expected_;
    std::string actual_;
  };

  class UnhandledFieldTypeError : public GeobindError {
   public:
    UnhandledFieldTypeError(int field_type, std::string call);
    int field_type() const { return field_type_; }

   private:
    int field_type_;
  };

  class InvalidFieldNameError : public GeobindError {
   public:
    InvalidFieldNameError(std::string field_name, std::string call);
    const std::string& field_name() const { return field_name_; }

   private:
    std::string field_name_;
  };

  class InvalidFieldIndexError : public GeobindError {
   public:
    InvalidFieldIndexError(std::size_t index, std::string call);
    std::size_t index() const { return index_; }

   private:
    std::size_t index_;
  };

  /** @brief A host string cannot be passed as a C string. */
  class StringConversionError : public GeobindError {
   public:
    explicit StringConversionError(const std::string& text);
  };

  class InvalidCoordinateRangeError : public GeobindError {
   public:
    InvalidCoordinateRangeError(std::string from, std::string to,
                                std::string message);
    const std::string& from() const { return from_; }
    const std::string& to() const { return to_; }

   private:
    std::string from_;
    std::string to_;
  };

  class BadArgumentError : public GeobindError {
   public:
    using GeobindError::GeobindError;
  };

  class BufferSizeMismatchError : public GeobindError {
   public:
    BufferSizeMismatchError(std::size_t expected, std::size_t actual);
    std::size_t expected() const { return expected_; }
    std::size_t actual() const { return actual_; }

   private:
    std::size_t expected_;
    std::size_t actual_;
  };

  /** @brief A borrowed view was used after its owner was closed. */
  class BorrowExpiredError : public GeobindError {
   public:
    explicit BorrowExpiredError(const std::string& what);
  };

  namespace detail {
    /**
     * @brief Reads the CPL error state left by a call that returned `status`,
     * resets it and returns it as a NativeError.
     */
    NativeError last_cpl_err(int status);

    /**
     * @brief Builds a NullPointerError for `call` from the CPL error message
     * and resets the error state.
     */
    NullPointerError last_null_pointer_err(const std::string& call);
  }  // namespace detail

}  // namespace geobind
