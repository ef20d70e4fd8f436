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

#include <cpl_conv.h>
#include <cpl_string.h>
#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace geobind {

  std::string to_c_string(std::string_view text) {
    if (text.find('\0') != std::string_view::npos) {
      throw StringConversionError(std::string(text));
    }
    return std::string(text);
  }

  std::string from_c_string(const char* text) {
    if (text == nullptr) return {};
    return std::string(text);
  }

  std::string take_cpl_string(char* text) {
    std::string result = from_c_string(text);
    CPLFree(text);
    return result;
  }

  std::vector<std::string> string_array(const char* const* list) {
    std::vector<std::string> result;
    if (list == nullptr) return result;
    for (; *list != nullptr; ++list) {
      result.emplace_back(*list);
    }
    return result;
  }

  CslEntry parse_csl_entry(std::string_view entry) {
    auto pos = entry.find('=');
    if (pos == std::string_view::npos) {
      return CslArg{std::string(entry)};
    }
    return CslAssign{std::string(entry.substr(0, pos)),
                     std::string(entry.substr(pos + 1))};
  }

  CslStringList::CslStringList(
      std::initializer_list<std::pair<std::string, std::string>> pairs) {
    for (const auto& [key, value] : pairs) {
      set_name_value(key, value);
    }
  }

  CslStringList::CslStringList(
      const std::vector<std::pair<std::string, std::string>>& pairs) {
    for (const auto& [key, value] : pairs) {
      set_name_value(key, value);
    }
  }

  CslStringList::~CslStringList() { CSLDestroy(list_); }

  CslStringList::CslStringList(const CslStringList& other)
      : list_(CSLDuplicate(other.list_)) {}

  CslStringList& CslStringList::operator=(const CslStringList& other) {
    if (this != &other) {
      char** copy = CSLDuplicate(other.list_);
      CSLDestroy(list_);
      list_ = copy;
    }
    return *this;
  }

  CslStringList::CslStringList(CslStringList&& other) noexcept
      : list_(std::exchange(other.list_, nullptr)) {}

  CslStringList& CslStringList::operator=(CslStringList&& other) noexcept {
    if (this != &other) {
      CSLDestroy(list_);
      list_ = std::exchange(other.list_, nullptr);
    }
    return *this;
  }

  void CslStringList::set_name_value(std::string_view name,
                                     std::string_view value) {
    bool valid_name =
        !name.empty() && std::all_of(name.begin(), name.end(), [](char c) {
          return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                 (c >= '0' && c <= '9') || c == '_';
        });
    if (!valid_name) {
      throw BadArgumentError(fmt::format(
          "Invalid characters in name: '{}'", name));
    }
    if (value.find_first_of("\r\n") != std::string_view::npos) {
      throw BadArgumentError(fmt::format(
          "Invalid characters in value: '{}'", value));
    }
    auto c_name = to_c_string(name);
    auto c_value = to_c_string(value);
    list_ = CSLSetNameValue(list_, c_name.c_str(), c_value.c_str());
  }

  void CslStringList::add_string(std::string_view value) {
    auto c_value = to_c_string(value);
    list_ = CSLAddString(list_, c_value.c_str());
  }

  std::optional<std::string> CslStringList::fetch_name_value(
      std::string_view key) const {
    auto c_key = to_c_string(key);
    const char* value = CSLFetchNameValue(list_, c_key.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
  }

  std::string CslStringList::fetch_name_value_or(
      std::string_view key, std::string_view default_value) const {
    auto c_key = to_c_string(key);
    auto c_default = to_c_string(default_value);
    return from_c_string(
        CSLFetchNameValueDef(list_, c_key.c_str(), c_default.c_str()));
  }

  namespace {
    std::optional<std::size_t> to_index(int idx) {
      if (idx < 0) return std::nullopt;
      return static_cast<std::size_t>(idx);
    }
  }  // namespace

  std::optional<std::size_t> CslStringList::find_string(
      std::string_view value) const {
    auto c_value = to_c_string(value);
    return to_index(CSLFindString(list_, c_value.c_str()));
  }

  std::optional<std::size_t> CslStringList::find_string_case_sensitive(
      std::string_view value) const {
    auto c_value = to_c_string(value);
    return to_index(CSLFindStringCaseSensitive(list_, c_value.c_str()));
  }

  std::optional<std::size_t> CslStringList::partial_find_string(
      std::string_view fragment) const {
    auto c_fragment = to_c_string(fragment);
    return to_index(CSLPartialFindString(list_, c_fragment.c_str()));
  }

  std::optional<std::string> CslStringList::get_field(std::size_t index) const {
    if (index >= size()) return std::nullopt;
    // CSLGetField returns "" for indices past the end
    const char* field = CSLGetField(list_, static_cast<int>(index));
    return std::string(field);
  }

  std::size_t CslStringList::size() const {
    return static_cast<std::size_t>(CSLCount(list_));
  }

  std::vector<CslEntry> CslStringList::entries() const {
    std::vector<CslEntry> result;
    for (const auto& entry : string_array(list_)) {
      result.push_back(parse_csl_entry(entry));
    }
    return result;
  }

  std::vector<std::pair<std::string, std::string>> CslStringList::to_pairs()
      const {
    std::vector<std::pair<std::string, std::string>> result;
    for (const auto& entry : entries()) {
      if (const auto* assign = std::get_if<CslAssign>(&entry)) {
        result.emplace_back(assign->key, assign->value);
      }
    }
    return result;
  }

  CslStringList CslStringList::from_c_ptr(char** list) {
    CslStringList result;
    result.list_ = list;
    return result;
  }

  CslStringList CslStringList::from_strings(
      const std::vector<std::string>& strings) {
    CslStringList result;
    for (const auto& s : strings) {
      result.add_string(s);
    }
    return result;
  }

}  // namespace geobind
