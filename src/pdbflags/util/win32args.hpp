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

#include <string>
#include <string_view>
#include <vector>

namespace util {

// Split `command_line` into arguments the way the Microsoft C runtime and
// CommandLineToArgvW do:
//
// - Arguments are delimited by whitespace outside of double quotes.
// - In the first argument (the program name) a double quote only toggles
//   quoting and backslashes are literal.
// - Elsewhere, 2n backslashes followed by a double quote produce n
//   backslashes and the double quote toggles quoting, while 2n+1
//   backslashes followed by a double quote produce n backslashes and a
//   literal double quote. Other backslashes are literal.
// - Two double quotes in a quoted section produce a literal double quote and
//   end the quoted section.
std::vector<std::string> split_win32_command_line(std::string_view command_line);

} // namespace util
