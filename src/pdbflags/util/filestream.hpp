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

#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>

namespace util {

// Owning handle of a `FILE*`, closed on destruction.
class FileStream
{
public:
  FileStream() = default;
  FileStream(const std::filesystem::path& path, const char* mode);

  explicit operator bool() const;
  FILE* operator*() const;

private:
  struct Closer
  {
    void
    operator()(FILE* file) const
    {
      fclose(file);
    }
  };

  std::unique_ptr<FILE, Closer> m_file;
};

inline FileStream::FileStream(const std::filesystem::path& path,
                              const char* mode)
  : m_file(fopen(path.string().c_str(), mode))
{
}

inline FileStream::operator bool() const
{
  return m_file != nullptr;
}

inline FILE*
FileStream::operator*() const
{
  return m_file.get();
}

} // namespace util
