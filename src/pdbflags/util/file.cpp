// Copyright (C) 2026 The pdbflags authors
//
// This program is free software; you can redistribute it and/or modify it
// under the terms of the GNU General Public License as published by the Free
// Software Foundation; either version 3 of the License, or (at your option)
// any later version.
//
// This program is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
// more details.
//
// You should have received a copy of the GNU General Public License along with
// this program; if not, write to the Free Software Foundation, Inc., 51
// Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA

#include "file.hpp"

#include <pdbflags/util/filestream.hpp>

#include <cerrno>
#include <cstring>

#ifndef PDBFLAGS_READ_BUFFER_SIZE
#  define PDBFLAGS_READ_BUFFER_SIZE 65536
#endif

namespace util {

tl::expected<std::string, std::string>
read_stream(FILE* const stream)
{
  std::string result;
  char buffer[PDBFLAGS_READ_BUFFER_SIZE];
  size_t n;
  while ((n = fread(buffer, 1, sizeof(buffer), stream)) > 0) {
    result.append(buffer, n);
  }
  if (ferror(stream)) {
    return tl::unexpected(strerror(errno));
  }
  return result;
}

tl::expected<std::string, std::string>
read_file(const std::filesystem::path& path)
{
  FileStream file(path, "rb");
  if (!file) {
    return tl::unexpected(strerror(errno));
  }
  return read_stream(*file);
}

} // namespace util
