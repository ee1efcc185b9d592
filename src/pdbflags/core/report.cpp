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

#include "report.hpp"

#include <pdbflags/compiler/commandline.hpp>
#include <pdbflags/core/exceptions.hpp>
#include <pdbflags/util/format.hpp>
#include <pdbflags/util/string.hpp>

#include <glaze/glaze.hpp>

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

namespace {

struct JsonReport
{
  std::string raw;
  int warning_level = 0;
  bool warnings_as_errors = false;
  bool optimizations_enabled = false;
  bool uses_debug_c_runtime = false;
  bool eliminate_duplicate_strings_enabled = false;
  bool whole_program_optimization_enabled = false;
  std::vector<uint32_t> warnings_explicitly_disabled;
};

} // namespace

// clang-format off
template<>
struct glz::meta<JsonReport>
{
  using T = JsonReport;
  static constexpr auto value = glz::object(
    "raw", &T::raw,
    "warning_level", &T::warning_level,
    "warnings_as_errors", &T::warnings_as_errors,
    "optimizations_enabled", &T::optimizations_enabled,
    "uses_debug_c_runtime", &T::uses_debug_c_runtime,
    "eliminate_duplicate_strings_enabled", &T::eliminate_duplicate_strings_enabled,
    "whole_program_optimization_enabled", &T::whole_program_optimization_enabled,
    "warnings_explicitly_disabled", &T::warnings_explicitly_disabled
  );
};
// clang-format on

namespace {

// Replace each byte that does not start a well-formed UTF-8 sequence with
// U+FFFD. Command lines read from a PDB are not guaranteed to be UTF-8.
std::string
replace_invalid_utf8(std::string_view text)
{
  std::string result;
  result.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    size_t length = 0;
    uint32_t min_code_point = 0;
    if (lead < 0x80) {
      length = 1;
    } else if ((lead & 0xE0) == 0xC0) {
      length = 2;
      min_code_point = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      min_code_point = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      min_code_point = 0x10000;
    }

    bool valid = length > 0 && i + length <= text.size();
    uint32_t code_point = length == 1 ? lead : lead & (0x7F >> length);
    for (size_t j = 1; valid && j < length; ++j) {
      const auto next = static_cast<unsigned char>(text[i + j]);
      valid = (next & 0xC0) == 0x80;
      code_point = (code_point << 6) | (next & 0x3F);
    }
    valid = valid && code_point >= min_code_point && code_point <= 0x10FFFF
            && (code_point < 0xD800 || code_point > 0xDFFF);

    if (valid) {
      result.append(text.substr(i, length));
      i += length;
    } else {
      result += "\xEF\xBF\xBD";
      ++i;
    }
  }
  return result;
}

std::string
format_human_readable(const compiler::CompilerCommandLine& command_line)
{
  const auto yes_no = [](bool value) { return std::string(value ? "yes" : "no"); };
  const auto& disabled = command_line.warnings_explicitly_disabled();

  const std::pair<std::string_view, std::string> rows[] = {
    {"Command line:", command_line.raw()},
    {"Warning level:", FMT("{}", command_line.warning_level())},
    {"Warnings as errors:", yes_no(command_line.warnings_as_errors())},
    {"Optimizations:", yes_no(command_line.optimizations_enabled())},
    {"Debug C runtime:", yes_no(command_line.uses_debug_c_runtime())},
    {"Eliminate duplicate strings:",
     yes_no(command_line.eliminate_duplicate_strings_enabled())},
    {"Whole program optimization:",
     yes_no(command_line.whole_program_optimization_enabled())},
    {"Disabled warnings:",
     disabled.empty() ? std::string("none") : util::join(disabled, ", ")},
  };

  size_t label_width = 0;
  for (const auto& [label, value] : rows) {
    label_width = std::max(label_width, label.length());
  }

  std::string result;
  for (const auto& [label, value] : rows) {
    if (value.empty()) {
      result += FMT("{}\n", label);
    } else {
      result += FMT("{:<{}} {}\n", label, label_width, value);
    }
  }
  return result;
}

std::string
format_tab(const compiler::CompilerCommandLine& command_line)
{
  const auto format_bool = [](bool value) { return value ? "true" : "false"; };

  std::string result;
  result += FMT("raw\t{}\n", command_line.raw());
  result += FMT("warning_level\t{}\n", command_line.warning_level());
  result +=
    FMT("warnings_as_errors\t{}\n", format_bool(command_line.warnings_as_errors()));
  result += FMT("optimizations_enabled\t{}\n",
                format_bool(command_line.optimizations_enabled()));
  result += FMT("uses_debug_c_runtime\t{}\n",
                format_bool(command_line.uses_debug_c_runtime()));
  result += FMT("eliminate_duplicate_strings_enabled\t{}\n",
                format_bool(command_line.eliminate_duplicate_strings_enabled()));
  result += FMT("whole_program_optimization_enabled\t{}\n",
                format_bool(command_line.whole_program_optimization_enabled()));
  result += FMT("warnings_explicitly_disabled\t{}\n",
                util::join(command_line.warnings_explicitly_disabled(), ","));
  return result;
}

std::string
format_json(const compiler::CompilerCommandLine& command_line)
{
  const JsonReport report{
    replace_invalid_utf8(command_line.raw()),
    command_line.warning_level(),
    command_line.warnings_as_errors(),
    command_line.optimizations_enabled(),
    command_line.uses_debug_c_runtime(),
    command_line.eliminate_duplicate_strings_enabled(),
    command_line.whole_program_optimization_enabled(),
    command_line.warnings_explicitly_disabled(),
  };

  std::string result;
  if (const auto error = glz::write_json(report, result)) {
    throw core::Error(
      FMT("Failed to write JSON report: {}", glz::format_error(error, result)));
  }
  result += '\n';
  return result;
}

} // namespace

namespace core {

tl::expected<ReportFormat, std::string>
parse_report_format(std::string_view value)
{
  if (value == "human") {
    return ReportFormat::human;
  } else if (value == "tab") {
    return ReportFormat::tab;
  } else if (value == "json") {
    return ReportFormat::json;
  } else {
    return tl::unexpected(FMT("unknown format \"{}\"", value));
  }
}

std::string_view
report_format_to_string(ReportFormat format)
{
  switch (format) {
  case ReportFormat::human:
    return "human";
  case ReportFormat::tab:
    return "tab";
  case ReportFormat::json:
    return "json";
  }
  return "human";
}

std::string
format_command_line_report(const compiler::CompilerCommandLine& command_line,
                           ReportFormat format)
{
  switch (format) {
  case ReportFormat::human:
    return format_human_readable(command_line);
  case ReportFormat::tab:
    return format_tab(command_line);
  case ReportFormat::json:
    return format_json(command_line);
  }
  return format_human_readable(command_line);
}

} // namespace core
