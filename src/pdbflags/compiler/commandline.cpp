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

#include "commandline.hpp"

#include <pdbflags/util/logging.hpp>
#include <pdbflags/util/string.hpp>
#include <pdbflags/util/win32args.hpp>

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <utility>

namespace {

// State of a warning as set by the last /wdNNNN, /weNNNN, /woNNNN or /wLNNNN
// option for it.
//
// The compiler keeps the level of a warning and its once and as-error markers
// in the same slot, so a later /wo or /we replaces an earlier /wd or
// /wL. A warning in the once or as_error state counts as enabled whatever the
// warning level is. For example, C4265 is not disabled by
//
//     cl.exe /c /W1 /wd4265 /w14265 /wo4265 C4265.cpp
enum class WarningState : uint8_t {
  level1 = 1,
  level2 = 2,
  level3 = 3,
  level4 = 4,
  as_error,
  once,
  disabled,
};

// Parse a per-warning option like /wd4996 or /w34265. `arg` is an option of
// length 7 starting with "/w" or "-w".
std::optional<std::pair<uint32_t, WarningState>>
parse_warning_option(std::string_view arg)
{
  WarningState state;
  const char mode = arg[2];
  if (mode == 'd') {
    state = WarningState::disabled;
  } else if (mode == 'e') {
    state = WarningState::as_error;
  } else if (mode == 'o') {
    state = WarningState::once;
  } else if (mode >= '1' && mode <= '4') {
    state = static_cast<WarningState>(mode - '0');
  } else {
    return std::nullopt;
  }

  const auto number = arg.substr(3);
  if (!std::all_of(number.begin(), number.end(), [](unsigned char ch) {
        return std::isdigit(ch);
      })) {
    LOG("Ignoring {} with malformed warning number", arg);
    return std::nullopt;
  }
  const auto warning = util::parse_unsigned(number, 0, UINT32_MAX, "warning");
  if (!warning) {
    LOG("Ignoring {}: {}", arg, warning.error());
    return std::nullopt;
  }
  return std::make_pair(static_cast<uint32_t>(*warning), state);
}

bool
is_warning_enabled(const WarningState state,
                   const int warning_level,
                   const uint32_t warning)
{
  switch (state) {
  case WarningState::as_error:
  case WarningState::once:
    return true;

  case WarningState::disabled:
    return false;

  case WarningState::level1:
  case WarningState::level2:
  case WarningState::level3:
  case WarningState::level4:
    return warning_level >= static_cast<int>(state);
  }

  LOG("Unexpected state {} of warning C{}, treating it as enabled",
      static_cast<int>(state),
      warning);
  return true;
}

} // namespace

namespace compiler {

bool
is_command_line_option(std::string_view arg)
{
  return !arg.empty() && (arg[0] == '/' || arg[0] == '-');
}

CompilerCommandLine::CompilerCommandLine(std::string_view command_line)
  : m_raw(command_line)
{
  std::map<uint32_t, WarningState> warning_states;

  for (const auto& arg : util::split_win32_command_line(command_line)) {
    if (!is_command_line_option(arg)) {
      continue;
    }

    // Options are matched on their exact length so that e.g. /Fooutput_O2
    // is not taken for /O2.
    const std::string_view option = std::string_view(arg).substr(1);
    switch (arg.length()) {
    case 2:
      if (option == "w") {
        // Disable all warnings.
        m_warning_level = 0;
      }
      break;

    case 3:
      if (option[0] == 'W') {
        if (option[1] == 'X') {
          m_warnings_as_errors = true;
        } else if (option[1] >= '0' && option[1] <= '4') {
          m_warning_level = option[1] - '0';
        }
      } else if (option == "O1" || option == "O2") {
        // "/GF is in effect when /O1 or /O2 is used."
        m_optimizations_enabled = true;
        m_eliminate_duplicate_strings_enabled = true;
      } else if (option == "Og" || option == "Os" || option == "Ot"
                 || option == "Ox") {
        m_optimizations_enabled = true;
      } else if (option == "Od") {
        m_optimizations_enabled = false;
      } else if (option == "MT" || option == "MD") {
        m_uses_debug_c_runtime = false;
      } else if (option == "GL") {
        m_whole_program_optimization_enabled = true;
      } else if (option == "GF") {
        m_eliminate_duplicate_strings_enabled = true;
      }
      break;

    case 4:
      if (option == "WX-") {
        m_warnings_as_errors = false;
      } else if (option == "MTd" || option == "MDd") {
        m_uses_debug_c_runtime = true;
      } else if (option == "GL-") {
        m_whole_program_optimization_enabled = false;
      }
      break;

    case 5:
      if (option == "Wall") {
        // All /W4 warnings plus the ones that are off by default.
        m_warning_level = 4;
      }
      break;

    case 7:
      if (option[0] == 'w') {
        if (const auto parsed = parse_warning_option(arg)) {
          warning_states[parsed->first] = parsed->second;
        }
      }
      break;

    default:
      break;
    }
  }

  // Note: The final warning level applies regardless of whether a /wLNNNN
  // option came before or after the /W option.
  for (const auto& [warning, state] : warning_states) {
    if (!is_warning_enabled(state, m_warning_level, warning)) {
      m_warnings_explicitly_disabled.push_back(warning);
    }
  }
}

bool
CompilerCommandLine::is_warning_explicitly_disabled(uint32_t warning) const
{
  return std::binary_search(m_warnings_explicitly_disabled.begin(),
                            m_warnings_explicitly_disabled.end(),
                            warning);
}

bool
CompilerCommandLine::operator==(const CompilerCommandLine& other) const
{
  return m_raw == other.m_raw && m_warning_level == other.m_warning_level
         && m_warnings_as_errors == other.m_warnings_as_errors
         && m_optimizations_enabled == other.m_optimizations_enabled
         && m_uses_debug_c_runtime == other.m_uses_debug_c_runtime
         && m_eliminate_duplicate_strings_enabled
              == other.m_eliminate_duplicate_strings_enabled
         && m_whole_program_optimization_enabled
              == other.m_whole_program_optimization_enabled
         && m_warnings_explicitly_disabled
              == other.m_warnings_explicitly_disabled;
}

} // namespace compiler
