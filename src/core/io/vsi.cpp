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


#include <geobind/io/vsi.hpp>
#include <geobind/logger/logger.h>

#include <cpl_conv.h>
#include <fmt/format.h>

#include <cstring>
#include <utility>

namespace geobind {

  std::vector<std::string> read_dir(std::string_view path, bool recursive) {
    auto c_path = to_c_string(path);
    char** entries = recursive ? VSIReadDirRecursive(c_path.c_str())
                               : VSIReadDir(c_path.c_str());
    if (entries == nullptr) {
      throw detail::last_null_pointer_err(recursive ? "VSIReadDirRecursive"
                                                    : "VSIReadDir");
    }
    auto list = CslStringList::from_c_ptr(entries);
    return string_array(list.as_ptr());
  }

  void create_mem_file(std::string_view file_name,
                       std::span<const std::uint8_t> data) {
    auto c_file_name = to_c_string(file_name);
    // GDAL takes over this buffer and frees it with VSIFree
    auto* buffer = static_cast<GByte*>(VSIMalloc(data.empty() ? 1 : data.size()));
    if (buffer == nullptr) {
      throw detail::last_null_pointer_err("VSIMalloc");
    }
    if (!data.empty()) std::memcpy(buffer, data.data(), data.size());

    VSILFILE* handle = VSIFileFromMemBuffer(c_file_name.c_str(), buffer,
                                            data.size(), TRUE);
    if (handle == nullptr) {
      VSIFree(buffer);
      throw detail::last_null_pointer_err("VSIFileFromMemBuffer");
    }
    VSIFCloseL(handle);
  }

  MemFileRef::MemFileRef(std::string_view file_name,
                         std::span<std::uint8_t> data)
      : file_name_(to_c_string(file_name)) {
    VSILFILE* handle = VSIFileFromMemBuffer(file_name_.c_str(), data.data(),
                                            data.size(), FALSE);
    if (handle == nullptr) {
      throw detail::last_null_pointer_err("VSIFileFromMemBuffer");
    }
    VSIFCloseL(handle);
  }

  MemFileRef::~MemFileRef() {
    if (file_name_.empty()) return;
    // already gone if the caller unlinked it
    if (VSIUnlink(file_name_.c_str()) != 0) {
      logger::Logger::get_logger().debug("In-memory file '{}' was already unlinked",
                                         file_name_);
    }
  }

  MemFileRef::MemFileRef(MemFileRef&& other) noexcept
      : file_name_(std::exchange(other.file_name_, std::string())) {}

  void unlink_mem_file(std::string_view file_name) {
    auto c_file_name = to_c_string(file_name);
    if (VSIUnlink(c_file_name.c_str()) != 0) {
      throw GeobindError(
          fmt::format("Unable to unlink in-memory file '{}'", c_file_name));
    }
  }

  std::vector<std::uint8_t> get_vsi_mem_file_bytes_owned(
      std::string_view file_name) {
    auto c_file_name = to_c_string(file_name);
    vsi_l_offset length = 0;
    // Seizing the buffer is unsafe for files over caller memory (MemFileRef),
    // GDAL hands back the caller's pointer. Copy, then unlink.
    GByte* bytes = VSIGetMemFileBuffer(c_file_name.c_str(), &length, FALSE);
    if (bytes == nullptr) {
      throw detail::last_null_pointer_err("VSIGetMemFileBuffer");
    }
    std::vector<std::uint8_t> result(bytes,
                                     bytes + static_cast<std::size_t>(length));
    unlink_mem_file(file_name);
    return result;
  }

}  // namespace geobind
