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

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace compiler {

// Return true if `arg` is an option, i.e. starts with '/' or '-', as opposed
// to e.g. a source file.
bool is_command_line_option(std::string_view arg);

// Compilation settings derived from a command line that an MSVC-style compiler
// recorded in a PDB.
//
// Only the options that matter for code quality and security analysis are
// interpreted (see <https://learn.microsoft.com/cpp/build/reference/>); all
// other arguments are ignored. Like the compiler, the last occurrence of an
// option wins over earlier conflicting ones.
class CompilerCommandLine
{
public:
  // Settings for an absent command line: all defaults.
  CompilerCommandLine() = default;

  explicit CompilerCommandLine(std::string_view command_line);

  // The command line as passed to the constructor.
  const std::string& raw() const;

  // Warning level in the range [0, 4] set by /w, /W0-/W4 and /Wall.
  int warning_level() const;

  // Whether /WX is in effect.
  bool warnings_as_errors() const;

  // Whether any of /O1, /O2, /Og, /Os, /Ot or /Ox is in effect.
  bool optimizations_enabled() const;

  // Whether a debug C runtime (/MDd or /MTd) is used.
  bool uses_debug_c_runtime() const;

  // Whether string pooling (/GF, implied by /O1 and /O2) is enabled.
  bool eliminate_duplicate_strings_enabled() const;

  // Whether whole program optimization (/GL) is enabled.
  bool whole_program_optimization_enabled() const;

  // Warnings that are disabled by /wdNNNN or by a /wLNNNN level above the
  // final warning level, in ascending order.
  const std::vector<uint32_t>& warnings_explicitly_disabled() const;

  bool is_warning_explicitly_disabled(uint32_t warning) const;

  bool operator==(const CompilerCommandLine& other) const;
  bool operator!=(const CompilerCommandLine& other) const;

private:
  std::string m_raw;
  int m_warning_level = 0;
  bool m_warnings_as_errors = false;
  bool m_optimizations_enabled = false;
  bool m_uses_debug_c_runtime = false;
  bool m_eliminate_duplicate_strings_enabled = false;
  bool m_whole_program_optimization_enabled = false;
  std::vector<uint32_t> m_warnings_explicitly_disabled;
};

// --- Inline implementations ---

inline const std::string&
CompilerCommandLine::raw() const
{
  return m_raw;
}

inline int
CompilerCommandLine::warning_level() const
{
  return m_warning_level;
}

inline bool
CompilerCommandLine::warnings_as_errors() const
{
  return m_warnings_as_errors;
}

inline bool
CompilerCommandLine::optimizations_enabled() const
{
  return m_optimizations_enabled;
}

inline bool
CompilerCommandLine::uses_debug_c_runtime() const
{
  return m_uses_debug_c_runtime;
}

inline bool
CompilerCommandLine::eliminate_duplicate_strings_enabled() const
{
  return m_eliminate_duplicate_strings_enabled;
}

inline bool
CompilerCommandLine::whole_program_optimization_enabled() const
{
  return m_whole_program_optimization_enabled;
}

inline const std::vector<uint32_t>&
CompilerCommandLine::warnings_explicitly_disabled() const
{
  return m_warnings_explicitly_disabled;
}

inline bool
CompilerCommandLine::operator!=(const CompilerCommandLine& other) const
{
  return !(*this == other);
}

} // namespace compiler
