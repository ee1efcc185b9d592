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

#include "mainoptions.hpp"

#include <pdbflags/compiler/commandline.hpp>
#include <pdbflags/config.hpp>
#include <pdbflags/core/exceptions.hpp>
#include <pdbflags/core/report.hpp>
#include <pdbflags/util/expected.hpp>
#include <pdbflags/util/file.hpp>
#include <pdbflags/util/format.hpp>
#include <pdbflags/util/logging.hpp>
#include <pdbflags/util/string.hpp>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#ifdef HAVE_GETOPT_LONG
#  include <getopt.h>
#else
#  error "getopt_long support is missing"
#endif

#ifndef PDBFLAGS_VERSION
#  define PDBFLAGS_VERSION "unknown"
#endif

namespace fs = std::filesystem;

namespace core {

constexpr const char VERSION_TEXT[] =
  R"({0} version {1}

Copyright (C) 2026 The pdbflags authors

This program is free software; you can redistribute it and/or modify it under
the terms of the GNU General Public License as published by the Free Software
Foundation; either version 3 of the License, or (at your option) any later
version.
)";

constexpr const char USAGE_TEXT[] =
  R"(Usage:
    {0} [options] [COMMAND_LINE ...]

    Print the compilation settings recorded in each COMMAND_LINE, a compiler
    command line as stored by MSVC in a PDB, e.g. "cl.exe /c /W3 /wd4996".

Options:
        --config-path PATH     read configuration settings from PATH
    -f, --file PATH            read command lines from PATH, one per line (use -
                               for standard input)
        --format FORMAT        specify output format: human, tab or json (one
                               object per line); default: human
    -k, --get-config KEY       print the configured value of KEY
    -p, --show-config          list all configuration settings and where
                               they were set
    -w, --is-disabled NUM      print "yes" or "no" for each command line
                               depending on whether warning NUM is explicitly
                               disabled

    -h, --help                 print this help text
    -V, --version              print version and copyright information
)";

namespace {

void
configuration_printer(const std::string& key,
                      const std::string& value,
                      const std::string& origin)
{
  PRINT(stdout, "({}) {} = {}\n", origin, key, value);
}

tl::expected<std::string, std::string>
read_from_path_or_stdin(const fs::path& path)
{
  if (path == "-") {
    return util::read_stream(stdin).map_error([&](const auto& error) {
      return FMT("Failed to read from stdin: {}", error);
    });
  } else {
    return util::read_file(path).map_error([&](const auto& error) {
      return FMT("Failed to read {}: {}", path, error);
    });
  }
}

enum : uint8_t {
  CONFIG_PATH = 'z' + 1,
  FORMAT,
};

const char options_string[] = "f:hk:pVw:";
const option long_options[] = {
  {"config-path", required_argument, nullptr, CONFIG_PATH},
  {"file",        required_argument, nullptr, 'f'        },
  {"format",      required_argument, nullptr, FORMAT     },
  {"get-config",  required_argument, nullptr, 'k'        },
  {"help",        no_argument,       nullptr, 'h'        },
  {"is-disabled", required_argument, nullptr, 'w'        },
  {"show-config", no_argument,       nullptr, 'p'        },
  {"version",     no_argument,       nullptr, 'V'        },
  {nullptr,       0,                 nullptr, 0          }
};

} // namespace

std::string
get_usage_text(const std::string_view program_name)
{
  return FMT(USAGE_TEXT, program_name);
}

int
process_main_options(int argc, const char* const* argv)
{
  const auto program_name = fs::path(argv[0]).filename().string();

  std::vector<std::string> config_settings;
  fs::path config_path;
  std::vector<fs::path> input_paths;
  std::optional<std::string> get_config_key;
  std::optional<uint32_t> queried_warning;
  bool show_config = false;

  int c;
  while ((c = getopt_long(argc,
                          const_cast<char* const*>(argv),
                          options_string,
                          long_options,
                          nullptr))
         != -1) {
    const std::string arg = optarg ? optarg : std::string();

    switch (c) {
    case CONFIG_PATH:
      config_path = arg;
      break;

    case 'f': // --file
      input_paths.emplace_back(arg);
      break;

    case FORMAT:
      util::throw_on_error<Error>(parse_report_format(arg));
      config_settings.push_back(FMT("format={}", arg));
      break;

    case 'h': // --help
      PRINT_RAW(stdout, get_usage_text(program_name));
      return EXIT_SUCCESS;

    case 'k': // --get-config
      get_config_key = arg;
      break;

    case 'p': // --show-config
      show_config = true;
      break;

    case 'V': // --version
      PRINT(stdout, VERSION_TEXT, program_name, PDBFLAGS_VERSION);
      return EXIT_SUCCESS;

    case 'w': // --is-disabled
      queried_warning =
        static_cast<uint32_t>(util::value_or_throw<Error>(util::parse_unsigned(
          arg, 0, UINT32_MAX, "warning number")));
      break;

    default:
      PRINT_RAW(stderr, get_usage_text(program_name));
      return EXIT_FAILURE;
    }
  }

  Config config;
  config.read(config_settings, config_path);
  util::logging::init(config.debug(), config.log_file());

  if (show_config) {
    config.visit_items(configuration_printer);
  }
  if (get_config_key) {
    PRINT(stdout, "{}\n", config.get_string_value(*get_config_key));
  }

  std::vector<std::string> command_lines(argv + optind, argv + argc);
  for (const auto& path : input_paths) {
    const auto content =
      util::value_or_throw<Fatal>(read_from_path_or_stdin(path));
    for (const auto line : util::split_lines(content)) {
      command_lines.emplace_back(line);
    }
  }

  if (command_lines.empty()) {
    if (show_config || get_config_key) {
      return EXIT_SUCCESS;
    }
    PRINT_RAW(stderr, get_usage_text(program_name));
    return EXIT_FAILURE;
  }

  for (size_t i = 0; i < command_lines.size(); ++i) {
    const compiler::CompilerCommandLine command_line(command_lines[i]);
    LOG("Command line: {}", command_line.raw());
    LOG("Warning level {}, explicitly disabled warnings: [{}]",
        command_line.warning_level(),
        util::join(command_line.warnings_explicitly_disabled(), ", "));

    if (queried_warning) {
      PRINT(stdout,
            "{}\n",
            command_line.is_warning_explicitly_disabled(*queried_warning)
              ? "yes"
              : "no");
      continue;
    }

    // JSON reports are one object per line.
    if (i > 0 && config.format() != ReportFormat::json) {
      PRINT_RAW(stdout, "\n");
    }
    PRINT_RAW(stdout,
              format_command_line_report(command_line, config.format()));
  }

  if (config.debug()) {
    PRINT_RAW(stderr, util::logging::debug_log());
  }

  return EXIT_SUCCESS;
}

} // namespace core
