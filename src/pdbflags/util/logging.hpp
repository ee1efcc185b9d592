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

#include <pdbflags/util/format.hpp>

#include <filesystem>
#include <string>
#include <string_view>

// Log `message_` if any log destination is enabled.
#define LOG_RAW(message_)                                                      \
  do {                                                                         \
    if (util::logging::enabled()) {                                            \
      util::logging::log(message_);                                            \
    }                                                                          \
  } while (false)

// Like LOG_RAW, with the message formatted from a compile-time checked format
// string. The arguments are not evaluated when logging is disabled.
#define LOG(format_, ...) LOG_RAW(FMT(format_, __VA_ARGS__))

namespace util::logging {

// Set up the log destinations: the in-memory debug log if `debug` is true and
// the file `log_file` (appended to) unless it is empty. Calling it again clears
// the debug log and closes the previous log file.
//
// A log file that cannot be opened is reported on stderr and then ignored.
void init(bool debug, const std::filesystem::path& log_file);

bool enabled();

// Write `message` plus a newline to the enabled destinations. Safe to call from
// several threads. If writing to the log file fails, the failure is reported
// once on stderr and the log file is dropped.
void log(std::string_view message);

std::string debug_log();

} // namespace util::logging
