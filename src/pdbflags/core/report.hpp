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

#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace compiler {
class CompilerCommandLine;
}

namespace core {

enum class ReportFormat { human, tab, json };

tl::expected<ReportFormat, std::string>
parse_report_format(std::string_view value);

std::string_view report_format_to_string(ReportFormat format);

// Format the settings of `command_line` in `format`. The result ends with a
// newline. A JSON report is a single line holding one object, with invalid
// UTF-8 in the raw command line replaced by U+FFFD.
std::string
format_command_line_report(const compiler::CompilerCommandLine& command_line,
                           ReportFormat format);

} // namespace core
