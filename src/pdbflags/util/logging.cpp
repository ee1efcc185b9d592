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

#include "logging.hpp"

#include <pdbflags/util/filestream.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <mutex>

#ifdef HAVE_UNISTD_H
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace {

// Guards logfile, logfile_path and debug_log_buffer.
std::mutex log_mutex;

fs::path logfile_path;
util::FileStream logfile;
std::string debug_log_buffer;

// Read without the mutex by enabled().
std::atomic<bool> debug_log_enabled = false;
std::atomic<bool> logfile_enabled = false;

// Called with log_mutex held.
void
drop_logfile(const char* action)
{
  const int saved_errno = errno;
  logfile = {};
  logfile_enabled = false;
  try {
    PRINT(stderr,
          "pdbflags: error: Failed to {} log file {}: {}\n",
          action,
          logfile_path,
          strerror(saved_errno));
  } catch (const std::runtime_error&) {
    // stderr is gone too.
  }
}

std::string
log_prefix()
{
  const auto now = std::chrono::system_clock::now();
  const auto usec = std::chrono::duration_cast<std::chrono::microseconds>(
                      now.time_since_epoch())
                    % std::chrono::seconds(1);
  const time_t sec = std::chrono::system_clock::to_time_t(now);

  struct tm tm;
  char timestamp[32] = "";
  if (localtime_r(&sec, &tm)) {
    (void)strftime(timestamp, sizeof(timestamp), "%Y-%m-%dT%H:%M:%S", &tm);
  }
  return FMT("[{}.{:06} {:<5}] ",
             timestamp,
             static_cast<unsigned int>(usec.count()),
             static_cast<int>(getpid()));
}

} // namespace

namespace util::logging {

void
init(bool debug, const fs::path& log_file)
{
  std::lock_guard<std::mutex> lock(log_mutex);

  debug_log_buffer.clear();
  debug_log_enabled = debug;

  logfile_path = log_file;
  logfile = {};
  logfile_enabled = false;
  if (!log_file.empty()) {
    logfile = FileStream(log_file, "a");
    if (logfile) {
      logfile_enabled = true;
    } else {
      drop_logfile("open");
    }
  }
}

bool
enabled()
{
  return debug_log_enabled || logfile_enabled;
}

void
log(std::string_view message)
{
  if (!enabled()) {
    return;
  }

  std::string line = log_prefix();
  line.append(message);
  line += '\n';

  std::lock_guard<std::mutex> lock(log_mutex);
  if (logfile
      && (fwrite(line.data(), line.size(), 1, *logfile) != 1
          || fflush(*logfile) == EOF)) {
    drop_logfile("write to");
  }
  if (debug_log_enabled) {
    debug_log_buffer += line;
  }
}

std::string
debug_log()
{
  std::lock_guard<std::mutex> lock(log_mutex);
  return debug_log_buffer;
}

} // namespace util::logging
