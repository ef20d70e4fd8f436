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

#include <geobind/common/cpl_string.hpp>
#include <geobind/common/errors.hpp>
#include <geobind/common/metadata.hpp>

#include <cpl_string.h>

namespace geobind {

  std::string MetadataInterface::description() const {
    return from_c_string(GDALGetDescription(major_object_ptr()));
  }

  void MetadataInterface::set_description(std::string_view description) {
    auto c_description = to_c_string(description);
    GDALSetDescription(major_object_ptr(), c_description.c_str());
  }

  std::vector<std::string> MetadataInterface::metadata_domains() const {
    // the returned list belongs to the caller
    auto domains = CslStringList::from_c_ptr(
        GDALGetMetadataDomainList(major_object_ptr()));
    return string_array(domains.as_ptr());
  }

  std::optional<std::vector<std::string>> MetadataInterface::metadata_domain(
      std::string_view domain) const {
    auto c_domain = to_c_string(domain);
    char** items = GDALGetMetadata(major_object_ptr(), c_domain.c_str());
    if (items == nullptr) return std::nullopt;
    return string_array(items);
  }

  std::optional<std::string> MetadataInterface::metadata_item(
      std::string_view key, std::string_view domain) const {
    auto c_key = to_c_string(key);
    auto c_domain = to_c_string(domain);
    const char* value =
        GDALGetMetadataItem(major_object_ptr(), c_key.c_str(), c_domain.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
  }

  void MetadataInterface::set_metadata_item(std::string_view key,
                                            std::string_view value,
                                            std::string_view domain) {
    auto c_key = to_c_string(key);
    auto c_value = to_c_string(value);
    auto c_domain = to_c_string(domain);
    CPLErr rv = GDALSetMetadataItem(major_object_ptr(), c_key.c_str(),
                                    c_value.c_str(), c_domain.c_str());
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
  }

  std::vector<MetadataEntry> MetadataInterface::metadata() const {
    std::vector<MetadataEntry> entries;
    for (const auto& domain : metadata_domains()) {
      auto items = metadata_domain(domain);
      if (!items) continue;
      for (const auto& item : *items) {
        auto entry = parse_csl_entry(item);
        if (auto* assign = std::get_if<CslAssign>(&entry))
          entries.push_back({domain, assign->key, assign->value});
      }
    }
    return entries;
  }

}  // namespace geobind
