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
 * GDAL's virtual file system, mainly the in-memory files under /vsimem/.
 */
#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <cpl_vsi.h>

#include <geobind/common/cpl_string.hpp>
#include <geobind/common/errors.hpp>

namespace geobind {

  /** @brief Entries of directory `path`, with all sub-directories when
   * `recursive`. */
  std::vector<std::string> read_dir(std::string_view path, bool recursive);

  /** @brief Creates in-memory file `file_name` holding a copy of `data`. */
  void create_mem_file(std::string_view file_name,
                       std::span<const std::uint8_t> data);

  /**
   * @brief An in-memory file over caller memory, unlinked when this object is
   * destroyed. The memory must outlive it.
   */
  class MemFileRef {
   public:
    MemFileRef(std::string_view file_name, std::span<std::uint8_t> data);
    ~MemFileRef();
    MemFileRef(MemFileRef&& other) noexcept;
    MemFileRef& operator=(MemFileRef&&) = delete;
    MemFileRef(const MemFileRef&) = delete;
    MemFileRef& operator=(const MemFileRef&) = delete;

    const std::string& file_name() const { return file_name_; }

   private:
    std::string file_name_;
  };

  void unlink_mem_file(std::string_view file_name);

  /** @brief Copies the bytes of an in-memory file and deletes the file. */
  std::vector<std::uint8_t> get_vsi_mem_file_bytes_owned(
      std::string_view file_name);

  /** @brief Calls `fun` on the bytes of an in-memory file without copying. */
  template <typename F>
  auto call_on_mem_file_bytes(std::string_view file_name, F&& fun) {
    auto c_file_name = to_c_string(file_name);
    vsi_l_offset length = 0;
    GByte* bytes = VSIGetMemFileBuffer(c_file_name.c_str(), &length, FALSE);
    if (bytes == nullptr) {
      throw detail::last_null_pointer_err("VSIGetMemFileBuffer");
    }
    return fun(std::span<const std::uint8_t>(
        bytes, static_cast<std::size_t>(length)));
  }

}  // namespace geobind
