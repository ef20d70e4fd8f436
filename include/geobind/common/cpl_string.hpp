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

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace geobind {

  /**
   * @brief Returns `text` checked for use as a NUL terminated C string.
   * Throws StringConversionError if `text` contains an embedded NUL.
   */
  std::string to_c_string(std::string_view text);

  /** @brief Copies a C string owned by GDAL. NULL gives an empty string. */
  std::string from_c_string(const char* text);

  /**
   * @brief Copies a C string that GDAL allocated for the caller and frees it
   * with CPLFree.
   */
  std::string take_cpl_string(char* text);

  /** @brief Copies a NULL terminated string array owned by GDAL. */
  std::vector<std::string> string_array(const char* const* list);

  /** @brief A "KEY=VALUE" entry of a CslStringList. */
  struct CslAssign {
    std::string key;
    std::string value;
    bool operator==(const CslAssign&) const = default;
  };
  /** @brief A flag-style entry of a CslStringList (no '='). */
  struct CslArg {
    std::string value;
    bool operator==(const CslArg&) const = default;
  };
  typedef std::variant<CslArg, CslAssign> CslEntry;

  CslEntry parse_csl_entry(std::string_view entry);

  /**
   * @brief Owns a NULL terminated `char**` string list as used by GDAL for
   * creation options, open options and the like.
   *
   * The list always ends with a NULL sentinel. An empty list is a NULL
   * pointer, which GDAL treats the same way.
   */
  class CslStringList {
   public:
    CslStringList() = default;
    CslStringList(
        std::initializer_list<std::pair<std::string, std::string>> pairs);
    explicit CslStringList(
        const std::vector<std::pair<std::string, std::string>>& pairs);
    ~CslStringList();

    CslStringList(const CslStringList& other);
    CslStringList& operator=(const CslStringList& other);
    CslStringList(CslStringList&& other) noexcept;
    CslStringList& operator=(CslStringList&& other) noexcept;

    /**
     * @brief Sets `name=value`, replacing an earlier value of `name`.
     *
     * `name` must be non-empty and only hold ASCII alphanumerics or '_',
     * `value` must not hold line breaks, otherwise BadArgumentError.
     */
    void set_name_value(std::string_view name, std::string_view value);

    /** @brief Appends a flat string, eg. a flag. */
    void add_string(std::string_view value);

    std::optional<std::string> fetch_name_value(std::string_view key) const;
    std::string fetch_name_value_or(std::string_view key,
                                    std::string_view default_value) const;

    /** @brief Index of an entry equal to `value`, ignoring case. */
    std::optional<std::size_t> find_string(std::string_view value) const;
    std::optional<std::size_t> find_string_case_sensitive(
        std::string_view value) const;
    /** @brief Index of the first entry that contains `fragment`. */
    std::optional<std::size_t> partial_find_string(
        std::string_view fragment) const;

    /** @brief Entry at `index`, none when out of range. */
    std::optional<std::string> get_field(std::size_t index) const;

    std::size_t size() const;
    bool empty() const { return size() == 0; }

    std::vector<CslEntry> entries() const;
    std::vector<std::pair<std::string, std::string>> to_pairs() const;

    /** @brief The list for GDAL calls taking `CSLConstList`. */
    char** as_ptr() const { return list_; }

    /**
     * @brief Takes ownership of a list allocated by GDAL, eg. returned by
     * CSLDuplicate.
     */
    static CslStringList from_c_ptr(char** list);

    /** @brief A list holding `strings` as they are, eg. "KEY=VALUE" items. */
    static CslStringList from_strings(const std::vector<std::string>& strings);

   private:
    char** list_ = nullptr;
  };

}  // namespace geobind
