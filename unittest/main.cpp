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

#include <pdbflags/util/format.hpp>

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#ifdef HAVE_UNISTD_H
#  include <unistd.h>
#endif

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {

int
prepare_test(int argc, char** argv)
{
  const fs::path dir_before = fs::current_path();
  const fs::path testdir = FMT("testdir/{}", getpid());

  fs::remove_all(testdir);
  fs::create_directories(testdir);
  fs::current_path(testdir);

  doctest::Context context;
  context.applyCommandLine(argc, argv);
  int result = context.run();

  if (result == EXIT_SUCCESS) {
    fs::current_path(dir_before);
    fs::remove_all(testdir);
  } else {
    PRINT(stderr, "Note: Test data has been left in {}\n", testdir);
  }

  return result;
}

} // namespace

int
main(int argc, char** argv)
{
  // Don't let the user's environment confuse configuration tests.
  unsetenv("PDBFLAGS_CONFIGPATH");
  unsetenv("PDBFLAGS_DEBUG");
  unsetenv("PDBFLAGS_NODEBUG");
  unsetenv("PDBFLAGS_FORMAT");
  unsetenv("PDBFLAGS_LOGFILE");

  try {
    return prepare_test(argc, argv);
  } catch (const fs::filesystem_error& e) {
    PRINT(stderr, "error: {}\n", e.what());
    return EXIT_FAILURE;
  }
}
