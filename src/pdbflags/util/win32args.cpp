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

#include "win32args.hpp"

namespace {

bool
is_blank(const char ch)
{
  return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
}

} // namespace

namespace util {

std::vector<std::string>
split_win32_command_line(std::string_view command_line)
{
  std::vector<std::string> args;
  const size_t length = command_line.length();
  size_t pos = 0;

  while (pos < length && is_blank(command_line[pos])) {
    ++pos;
  }
  if (pos == length) {
    return args;
  }

  std::string arg;

  // Used to track quoting state; if false we are not inside quotes.
  bool quoting = false;

  // The program name is special: no backslash escapes, quotes just toggle.
  while (pos < length && (quoting || !is_blank(command_line[pos]))) {
    if (command_line[pos] == '"') {
      quoting = !quoting;
    } else {
      arg += command_line[pos];
    }
    ++pos;
  }
  args.push_back(arg);

  while (true) {
    while (pos < length && is_blank(command_line[pos])) {
      ++pos;
    }
    if (pos == length) {
      return args;
    }

    arg.clear();
    quoting = false;
    while (pos < length) {
      const char ch = command_line[pos];
      if (ch == '\\') {
        size_t count = 0;
        while (pos < length && command_line[pos] == '\\') {
          ++count;
          ++pos;
        }
        if (pos < length && command_line[pos] == '"') {
          // If an odd number of backslashes is followed by a double quotation
          // mark, one backslash is placed in the argument for every pair of
          // backslashes, and the double quotation mark is "escaped" by the
          // remaining backslash. For an even number the double quotation mark
          // is left for the quoting logic below.
          arg.append(count / 2, '\\');
          if (count % 2 != 0) {
            arg += '"';
            ++pos;
          }
        } else {
          // Backslashes are interpreted literally, unless they immediately
          // precede a double quotation mark.
          arg.append(count, '\\');
        }
        continue;
      }

      if (ch == '"') {
        ++pos;
        if (quoting && pos < length && command_line[pos] == '"') {
          // A double quote directly following a closing quote is plain text
          // adjacent to the quoted group.
          arg += '"';
          ++pos;
          quoting = false;
        } else {
          quoting = !quoting;
        }
        continue;
      }

      if (!quoting && is_blank(ch)) {
        break;
      }
      arg += ch;
      ++pos;
    }
    args.push_back(arg);
  }
}

} // namespace util
