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

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gdal.h>

namespace geobind {

  struct MetadataEntry {
    std::string domain;
    std::string key;
    std::string value;
    bool operator==(const MetadataEntry&) const = default;
  };

  /**
   * @brief Description and metadata access shared by every GDAL major object
   * (drivers, datasets, bands, layers).
   *
   * The empty string selects the default metadata domain.
   */
  struct MetadataInterface {
    virtual ~MetadataInterface() = default;

    virtual GDALMajorObjectH major_object_ptr() const = 0;

    std::string description() const;
    void set_description(std::string_view description);

    std::vector<std::string> metadata_domains() const;
    std::optional<std::vector<std::string>> metadata_domain(
        std::string_view domain) const;
    std::optional<std::string> metadata_item(std::string_view key,
                                             std::string_view domain) const;
    void set_metadata_item(std::string_view key, std::string_view value,
                           std::string_view domain = "");

    /** @brief Every KEY=VALUE item of every domain. */
    std::vector<MetadataEntry> metadata() const;
  };

}  // namespace geobind
