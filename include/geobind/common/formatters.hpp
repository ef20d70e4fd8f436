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

#pragma once

#include <fmt/format.h>

#include <optional>

#include <geobind/common/common.hpp>
#include <geobind/common/error_handler.hpp>
#include <geobind/common/errors.hpp>

// Formatter for geobind::Envelope
template <>
struct fmt::formatter<geobind::Envelope> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const geobind::Envelope& env, fmt::format_context& ctx) const {
    return fmt::format_to(ctx.out(), "[{},{},{},{}]", env.min_x, env.min_y,
                          env.max_x, env.max_y);
  }
};

// Formatter for std::optional<geobind::Envelope>, empty when unset
template <>
struct fmt::formatter<std::optional<geobind::Envelope>> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const std::optional<geobind::Envelope>& env,
              fmt::format_context& ctx) const {
    if (!env.has_value()) {
      return fmt::format_to(ctx.out(), "");
    } else {
      return fmt::format_to(ctx.out(), "[{},{},{},{}]", env->min_x,
                            env->min_y, env->max_x, env->max_y);
    }
  }
};

// Formatter for geobind::Envelope3D
template <>
struct fmt::formatter<geobind::Envelope3D> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const geobind::Envelope3D& env, fmt::format_context& ctx) const {
    return fmt::format_to(ctx.out(), "[{},{},{},{},{},{}]", env.min_x,
                          env.min_y, env.min_z, env.max_x, env.max_y,
                          env.max_z);
  }
};

// Formatter for geobind::arr3d
template <>
struct fmt::formatter<geobind::arr3d> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const geobind::arr3d& arr, fmt::format_context& ctx) const {
    return fmt::format_to(ctx.out(), "[{},{},{}]", arr[0], arr[1], arr[2]);
  }
};

// Formatter for geobind::DateTime as IETF RFC 3339, eg. 2024-05-01T12:30:00Z
template <>
struct fmt::formatter<geobind::DateTime> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const geobind::DateTime& dt, fmt::format_context& ctx) const {
    return fmt::format_to(ctx.out(), "{}", dt.format_to_ietf());
  }
};

template <>
struct fmt::formatter<geobind::CplErrType> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  auto format(geobind::CplErrType severity, fmt::format_context& ctx) const {
    return fmt::format_to(ctx.out(), "{}", geobind::to_string(severity));
  }
};

// Formatter for geobind::ErrorRecord, eg. (Failure, 42, "foo")
template <>
struct fmt::formatter<geobind::ErrorRecord> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const geobind::ErrorRecord& record,
              fmt::format_context& ctx) const {
    return fmt::format_to(ctx.out(), "({}, {}, \"{}\")",
                          geobind::to_string(record.severity), record.code,
                          record.message);
  }
};
