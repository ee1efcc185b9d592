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

#include "testutil.hpp"

#include <pdbflags/core/exceptions.hpp>
#include <pdbflags/util/filestream.hpp>
#include <pdbflags/util/format.hpp>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace fs = std::filesystem;

namespace TestUtil {

size_t TestContext::m_subdir_counter = 0;

TestContext::TestContext()
  : m_test_dir(fs::current_path())
{
  if (m_test_dir.parent_path().filename() != "testdir") {
    throw core::Error("TestContext instantiated outside test directory");
  }
  ++m_subdir_counter;
  fs::path subtest_dir = m_test_dir / FMT("test_{}", m_subdir_counter);
  std::error_code ec;
  fs::create_directories(subtest_dir, ec);
  if (ec) {
    throw core::Error(FMT("Failed to create {}: {}", subtest_dir, ec.message()));
  }
  fs::current_path(subtest_dir, ec);
  if (ec) {
    throw core::Error(
      FMT("Failed to change directory to {}: {}", subtest_dir, ec.message()));
  }
}

TestContext::~TestContext()
{
  std::error_code ec;
  fs::current_path(m_test_dir, ec);
}

void
write_file(const fs::path& path, std::string_view data)
{
  util::FileStream file(path, "wb");
  if (!file) {
    throw core::Error(
      FMT("Failed to open {} for writing: {}", path, strerror(errno)));
  }
  if (fwrite(data.data(), 1, data.size(), *file) != data.size()) {
    throw core::Error(FMT("Failed to write {}: {}", path, strerror(errno)));
  }
}

} // namespace TestUtil
