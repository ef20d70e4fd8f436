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

#include <geobind/common/common.hpp>

#include <fmt/format.h>

#include <cmath>
#include <cstdlib>

namespace geobind {

  std::string Date::format_to_ietf() const {
    return fmt::format("{:04}-{:02}-{:02}", year, month, day);
  }

  // Format to date-time according to
  // https://datatracker.ietf.org/doc/html/rfc3339#section-5.6
  // An unknown or local time zone is written as UTC.
  std::string DateTime::format_to_ietf() const {
    int seconds = static_cast<int>(std::floor(time.second));
    std::string result = fmt::format("{}T{:02}:{:02}:{:02}",
                                     date.format_to_ietf(), time.hour,
                                     time.minute, seconds);
    if (time.timeZone <= 1 || time.timeZone == 100) {
      return result + "Z";
    }
    int offset_minutes = (time.timeZone - 100) * 15;
    char sign = offset_minutes < 0 ? '-' : '+';
    offset_minutes = std::abs(offset_minutes);
    return fmt::format("{}{}{:02}:{:02}", result, sign, offset_minutes / 60,
                       offset_minutes % 60);
  }

}  // namespace geobind
