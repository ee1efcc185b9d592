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

#include <pdbflags/compiler/commandline.hpp>
#include <pdbflags/util/logging.hpp>

#include <doctest/doctest.h>

#include <cstdint>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

using compiler::CompilerCommandLine;
using compiler::is_command_line_option;

using Warnings = std::vector<uint32_t>;

namespace {

void
check_defaults(const CompilerCommandLine& command_line)
{
  CHECK(command_line.warning_level() == 0);
  CHECK(!command_line.warnings_as_errors());
  CHECK(!command_line.optimizations_enabled());
  CHECK(!command_line.uses_debug_c_runtime());
  CHECK(!command_line.eliminate_duplicate_strings_enabled());
  CHECK(!command_line.whole_program_optimization_enabled());
  CHECK(command_line.warnings_explicitly_disabled().empty());
}

} // namespace

TEST_SUITE_BEGIN("compiler");

TEST_CASE("is_command_line_option")
{
  CHECK(is_command_line_option("/W3"));
  CHECK(is_command_line_option("-W3"));
  CHECK(is_command_line_option("/"));
  CHECK(!is_command_line_option(""));
  CHECK(!is_command_line_option("cl.exe"));
  CHECK(!is_command_line_option("foo.cpp"));
  CHECK(!is_command_line_option("C:\\src\\foo.cpp"));
}

TEST_CASE("CompilerCommandLine defaults")
{
  SUBCASE("Absent command line")
  {
    CompilerCommandLine command_line;
    CHECK(command_line.raw() == "");
    check_defaults(command_line);
  }

  SUBCASE("Empty command line")
  {
    CompilerCommandLine command_line("");
    CHECK(command_line.raw() == "");
    check_defaults(command_line);
    CHECK(command_line == CompilerCommandLine());
  }

  SUBCASE("Only whitespace")
  {
    CompilerCommandLine command_line(" \t ");
    CHECK(command_line.raw() == " \t ");
    check_defaults(command_line);
  }

  SUBCASE("No options")
  {
    CompilerCommandLine command_line("cl.exe foo.cpp bar.cpp");
    check_defaults(command_line);
  }

  SUBCASE("Unknown options")
  {
    CompilerCommandLine command_line(
      "cl.exe /nologo /EHsc /Zi /Fdfoo.pdb /I include /DNDEBUG foo.cpp");
    check_defaults(command_line);
  }
}

TEST_CASE("CompilerCommandLine keeps the raw command line")
{
  const std::string raw = R"(cl.exe  /c "/Fo out dir\\" /W3)";
  CHECK(CompilerCommandLine(raw).raw() == raw);
}

TEST_CASE("CompilerCommandLine warning level")
{
  CHECK(CompilerCommandLine("cl.exe /W0").warning_level() == 0);
  CHECK(CompilerCommandLine("cl.exe /W1").warning_level() == 1);
  CHECK(CompilerCommandLine("cl.exe /W2").warning_level() == 2);
  CHECK(CompilerCommandLine("cl.exe /W3").warning_level() == 3);
  CHECK(CompilerCommandLine("cl.exe /W4").warning_level() == 4);
  CHECK(CompilerCommandLine("cl.exe -W3").warning_level() == 3);
  CHECK(CompilerCommandLine("cl.exe /Wall").warning_level() == 4);
  CHECK(CompilerCommandLine("cl.exe -Wall").warning_level() == 4);
  CHECK(CompilerCommandLine("cl.exe /W4 /w").warning_level() == 0);
  CHECK(CompilerCommandLine("cl.exe /w /W2").warning_level() == 2);
  CHECK(CompilerCommandLine("cl.exe /Wall /W1").warning_level() == 1);
  CHECK(CompilerCommandLine("cl.exe /W1 /Wall").warning_level() == 4);

  SUBCASE("Out of range and near misses are ignored")
  {
    CHECK(CompilerCommandLine("cl.exe /W3 /W5").warning_level() == 3);
    CHECK(CompilerCommandLine("cl.exe /W3 /W9").warning_level() == 3);
    CHECK(CompilerCommandLine("cl.exe /W3 /W").warning_level() == 3);
    CHECK(CompilerCommandLine("cl.exe /W3 /W33").warning_level() == 3);
    CHECK(CompilerCommandLine("cl.exe /W3 /Wal").warning_level() == 3);
    CHECK(CompilerCommandLine("cl.exe /W3 /Walls").warning_level() == 3);
    CHECK(CompilerCommandLine("cl.exe /W3 /ww").warning_level() == 3);
    CHECK(CompilerCommandLine("cl.exe /W3 W1").warning_level() == 3);
  }

  SUBCASE("Program name that looks like an option")
  {
    CHECK(CompilerCommandLine("/W2 /c foo.cpp").warning_level() == 2);
  }
}

TEST_CASE("CompilerCommandLine warnings as errors")
{
  CHECK(CompilerCommandLine("cl.exe /WX").warnings_as_errors());
  CHECK(CompilerCommandLine("cl.exe -WX").warnings_as_errors());
  CHECK(!CompilerCommandLine("cl.exe /WX /WX-").warnings_as_errors());
  CHECK(CompilerCommandLine("cl.exe /WX- /WX").warnings_as_errors());
  CHECK(!CompilerCommandLine("cl.exe /WX-").warnings_as_errors());
  CHECK(!CompilerCommandLine("cl.exe /WX+").warnings_as_errors());

  // /WX does not affect the warning level.
  CHECK(CompilerCommandLine("cl.exe /W2 /WX").warning_level() == 2);
}

TEST_CASE("CompilerCommandLine optimizations")
{
  SUBCASE("Enabling options")
  {
    for (const char* option : {"/O1", "/O2", "/Og", "/Os", "/Ot", "/Ox"}) {
      CAPTURE(option);
      CompilerCommandLine command_line(std::string("cl.exe ") + option);
      CHECK(command_line.optimizations_enabled());
    }
  }

  SUBCASE("/O1 and /O2 imply /GF")
  {
    CHECK(CompilerCommandLine("cl.exe /O1").eliminate_duplicate_strings_enabled());
    CHECK(CompilerCommandLine("cl.exe /O2").eliminate_duplicate_strings_enabled());
    for (const char* option : {"/Og", "/Os", "/Ot", "/Ox"}) {
      CAPTURE(option);
      CompilerCommandLine command_line(std::string("cl.exe ") + option);
      CHECK(!command_line.eliminate_duplicate_strings_enabled());
    }
  }

  SUBCASE("/Od disables")
  {
    CompilerCommandLine command_line("cl.exe /O2 /Od");
    CHECK(!command_line.optimizations_enabled());
    // String pooling implied by the earlier /O2 stays in effect.
    CHECK(command_line.eliminate_duplicate_strings_enabled());

    CHECK(CompilerCommandLine("cl.exe /Od /Ox").optimizations_enabled());
  }

  SUBCASE("Other /O options are ignored")
  {
    CHECK(!CompilerCommandLine("cl.exe /Ob2").optimizations_enabled());
    CHECK(!CompilerCommandLine("cl.exe /Oi").optimizations_enabled());
    CHECK(!CompilerCommandLine("cl.exe /Oy-").optimizations_enabled());
    CHECK(CompilerCommandLine("cl.exe /O2 /Oi").optimizations_enabled());
  }

  SUBCASE("Suffix of a longer option does not match")
  {
    CompilerCommandLine command_line("cl.exe /FoO2 /Fdbuild_O1 foo.cpp");
    CHECK(!command_line.optimizations_enabled());
    CHECK(!command_line.eliminate_duplicate_strings_enabled());
  }
}

TEST_CASE("CompilerCommandLine C runtime")
{
  CHECK(CompilerCommandLine("cl.exe /MDd").uses_debug_c_runtime());
  CHECK(CompilerCommandLine("cl.exe /MTd").uses_debug_c_runtime());
  CHECK(!CompilerCommandLine("cl.exe /MD").uses_debug_c_runtime());
  CHECK(!CompilerCommandLine("cl.exe /MT").uses_debug_c_runtime());
  CHECK(!CompilerCommandLine("cl.exe /MDd /MD").uses_debug_c_runtime());
  CHECK(!CompilerCommandLine("cl.exe /MTd /MT").uses_debug_c_runtime());
  CHECK(CompilerCommandLine("cl.exe /MT /MDd").uses_debug_c_runtime());
  CHECK(!CompilerCommandLine("cl.exe /MP").uses_debug_c_runtime());
  CHECK(!CompilerCommandLine("cl.exe /LDd").uses_debug_c_runtime());
}

TEST_CASE("CompilerCommandLine whole program optimization")
{
  CHECK(CompilerCommandLine("cl.exe /GL").whole_program_optimization_enabled());
  CHECK(!CompilerCommandLine("cl.exe /GL /GL-")
           .whole_program_optimization_enabled());
  CHECK(CompilerCommandLine("cl.exe /GL- /GL")
          .whole_program_optimization_enabled());
  CHECK(!CompilerCommandLine("cl.exe /GL-").whole_program_optimization_enabled());
}

TEST_CASE("CompilerCommandLine string pooling")
{
  CHECK(CompilerCommandLine("cl.exe /GF").eliminate_duplicate_strings_enabled());
  CHECK(!CompilerCommandLine("cl.exe /GF-").eliminate_duplicate_strings_enabled());
  CHECK(!CompilerCommandLine("cl.exe /Gy").eliminate_duplicate_strings_enabled());
}

TEST_CASE("CompilerCommandLine explicitly disabled warnings")
{
  SUBCASE("Disabled warnings are sorted")
  {
    CompilerCommandLine command_line("cl.exe /c /W3 /wd4996 /wd4100");
    CHECK(command_line.warning_level() == 3);
    CHECK(command_line.warnings_explicitly_disabled() == Warnings{4100, 4996});
    CHECK(command_line.is_warning_explicitly_disabled(4100));
    CHECK(command_line.is_warning_explicitly_disabled(4996));
    CHECK(!command_line.is_warning_explicitly_disabled(4101));
  }

  SUBCASE("Duplicates are reported once")
  {
    CompilerCommandLine command_line("cl.exe /wd4996 /wd4996 -wd4996");
    CHECK(command_line.warnings_explicitly_disabled() == Warnings{4996});
  }

  SUBCASE("Leading zeros")
  {
    CompilerCommandLine command_line("cl.exe /wd0042");
    CHECK(command_line.warnings_explicitly_disabled() == Warnings{42});
  }

  SUBCASE("As error and once mean enabled")
  {
    CompilerCommandLine command_line("cl.exe /W4 /we4265 /wo4266");
    CHECK(command_line.warnings_explicitly_disabled().empty());
  }

  SUBCASE("Last option for a warning wins")
  {
    CHECK(CompilerCommandLine("cl.exe /W1 /w14265 /wd4265")
            .warnings_explicitly_disabled()
          == Warnings{4265});
    CHECK(CompilerCommandLine("cl.exe /W1 /wd4265 /w14265")
            .warnings_explicitly_disabled()
            .empty());
    CHECK(CompilerCommandLine("cl.exe /we4265 /wd4265")
            .warnings_explicitly_disabled()
          == Warnings{4265});
    CHECK(CompilerCommandLine("cl.exe /wd4265 /we4265")
            .warnings_explicitly_disabled()
            .empty());
  }

  SUBCASE("Once after disabled and level enables the warning")
  {
    CompilerCommandLine command_line("cl.exe /c /W1 /wd4265 /w14265 /wo4265");
    CHECK(command_line.warnings_explicitly_disabled().empty());
  }

  SUBCASE("Per-warning level compared with the final warning level")
  {
    CHECK(CompilerCommandLine("cl.exe /W3 /w44996")
            .warnings_explicitly_disabled()
          == Warnings{4996});
    CHECK(CompilerCommandLine("cl.exe /W4 /w44996")
            .warnings_explicitly_disabled()
            .empty());
    CHECK(CompilerCommandLine("cl.exe /W2 /w34996 /w24995 /w14994")
            .warnings_explicitly_disabled()
          == Warnings{4996});
    CHECK(CompilerCommandLine("cl.exe /w14996")
            .warnings_explicitly_disabled()
          == Warnings{4996});
    CHECK(CompilerCommandLine("cl.exe /Wall /w44996 /w")
            .warnings_explicitly_disabled()
          == Warnings{4996});
  }

  SUBCASE("Order of /W and per-warning level does not matter")
  {
    const CompilerCommandLine before("cl.exe /w14996 /W2");
    const CompilerCommandLine after("cl.exe /W2 /w14996");
    CHECK(!before.is_warning_explicitly_disabled(4996));
    CHECK(!after.is_warning_explicitly_disabled(4996));
    CHECK(before.warnings_explicitly_disabled()
          == after.warnings_explicitly_disabled());

    CHECK(CompilerCommandLine("cl.exe /w34996 /W2")
            .warnings_explicitly_disabled()
          == Warnings{4996});
    CHECK(CompilerCommandLine("cl.exe /W2 /w34996")
            .warnings_explicitly_disabled()
          == Warnings{4996});
  }

  SUBCASE("Malformed per-warning options are ignored")
  {
    CompilerCommandLine command_line(
      "cl.exe /wd499x /wdabcd /wd-123 /wd+123 /w54996 /w04996 /wx4996 /wd123"
      " /wd12345 /wd 4996 /Wd4996");
    CHECK(command_line.warnings_explicitly_disabled().empty());
    check_defaults(command_line);
  }

  SUBCASE("Malformed option does not affect earlier state of the warning")
  {
    CompilerCommandLine command_line("cl.exe /wd4996 /we499x");
    CHECK(command_line.warnings_explicitly_disabled() == Warnings{4996});
  }

  SUBCASE("Quoted option")
  {
    CompilerCommandLine command_line(R"(cl.exe "/wd4996" "/W"3)");
    CHECK(command_line.warnings_explicitly_disabled() == Warnings{4996});
    CHECK(command_line.warning_level() == 3);
  }

  SUBCASE("Quoted option with embedded space is one argument")
  {
    CompilerCommandLine command_line(R"(cl.exe "/wd 996")");
    CHECK(command_line.warnings_explicitly_disabled().empty());
  }
}

TEST_CASE("CompilerCommandLine combined")
{
  SUBCASE("Release build")
  {
    CompilerCommandLine command_line("cl.exe /O2 /MDd /GL");
    CHECK(command_line.optimizations_enabled());
    CHECK(command_line.eliminate_duplicate_strings_enabled());
    CHECK(command_line.uses_debug_c_runtime());
    CHECK(command_line.whole_program_optimization_enabled());
    CHECK(command_line.warning_level() == 0);
    CHECK(!command_line.warnings_as_errors());
  }

  SUBCASE("/Wall /WX-")
  {
    CompilerCommandLine command_line("cl.exe /Wall /WX-");
    CHECK(command_line.warning_level() == 4);
    CHECK(!command_line.warnings_as_errors());
  }

  SUBCASE("Recorded PDB command line")
  {
    CompilerCommandLine command_line(
      R"(-c -ID:\a\_work\1\s\inc -Zi -nologo -W4 -WX -diagnostics:column)"
      R"( -sdl -O2 -Oi -GL -DNDEBUG -D_CONSOLE -D_UNICODE -DUNICODE -Gm- -EHsc)"
      R"( -MT -GS -Gy -fp:precise -permissive- -Zc:wchar_t -Zc:forScope)"
      R"( -Zc:inline -external:W4 -Gd -TP -FC -errorreport:prompt -wd4100)"
      R"( -we4700 -w44265 "-FoD:\a\_work\1\s\x64\Release\\")");
    CHECK(command_line.warning_level() == 4);
    CHECK(command_line.warnings_as_errors());
    CHECK(command_line.optimizations_enabled());
    CHECK(command_line.eliminate_duplicate_strings_enabled());
    CHECK(!command_line.uses_debug_c_runtime());
    CHECK(command_line.whole_program_optimization_enabled());
    CHECK(command_line.warnings_explicitly_disabled() == Warnings{4100});
  }

  SUBCASE("Appending a conflicting option only changes its own setting")
  {
    const std::string prefix = "cl.exe /W3 /WX /O2 /MDd /GL /wd4996";
    const CompilerCommandLine base(prefix);
    const CompilerCommandLine changed(prefix + " /MD");
    CHECK(!changed.uses_debug_c_runtime());
    CHECK(changed.warning_level() == base.warning_level());
    CHECK(changed.warnings_as_errors() == base.warnings_as_errors());
    CHECK(changed.optimizations_enabled() == base.optimizations_enabled());
    CHECK(changed.eliminate_duplicate_strings_enabled()
          == base.eliminate_duplicate_strings_enabled());
    CHECK(changed.whole_program_optimization_enabled()
          == base.whole_program_optimization_enabled());
    CHECK(changed.warnings_explicitly_disabled()
          == base.warnings_explicitly_disabled());
  }
}

TEST_CASE("CompilerCommandLine is deterministic")
{
  const std::string raw = "cl.exe /W3 /wd4996 /w44100 /O1 /MTd /GL /WX";
  const CompilerCommandLine first(raw);
  const CompilerCommandLine second(raw);
  CHECK(first == second);
  CHECK(!(first != second));
  CHECK(first != CompilerCommandLine("cl.exe /W3"));
}

TEST_CASE("CompilerCommandLine from several threads with debug logging")
{
  const std::string raw =
    "cl.exe /W3 /wd4996 /wdABCD /w44100 /O2 /MDd /GL /WX /we4265";
  const size_t thread_count = 8;
  const size_t iterations = 50;

  util::logging::init(true, "");
  const CompilerCommandLine expected(raw);

  std::vector<std::vector<CompilerCommandLine>> results(thread_count);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < thread_count; ++i) {
    threads.emplace_back([&raw, &result = results[i]] {
      for (size_t j = 0; j < iterations; ++j) {
        result.emplace_back(raw);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (const auto& thread_results : results) {
    REQUIRE(thread_results.size() == iterations);
    for (const auto& command_line : thread_results) {
      CHECK(command_line == expected);
    }
  }
  CHECK(expected.warnings_explicitly_disabled() == Warnings{4100, 4996});

  const std::string log = util::logging::debug_log();
  const std::string entry = "] Ignoring /wdABCD with malformed warning number\n";
  size_t count = 0;
  for (size_t pos = log.find(entry); pos != std::string::npos;
       pos = log.find(entry, pos + entry.size())) {
    ++count;
  }
  CHECK(count == thread_count * iterations + 1);

  util::logging::init(false, "");
}

TEST_SUITE_END();
