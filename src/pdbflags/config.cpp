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

#include "config.hpp"

#include <pdbflags/core/exceptions.hpp>
#include <pdbflags/util/expected.hpp>
#include <pdbflags/util/file.hpp>
#include <pdbflags/util/format.hpp>
#include <pdbflags/util/string.hpp>

#include <algorithm>
#include <cstdlib>

namespace fs = std::filesystem;

namespace {

enum class ConfigItem { debug, format, log_file };

struct ItemInfo
{
  std::string_view key;
  std::string_view env_name; // without the PDBFLAGS_ prefix
  ConfigItem item;
  bool is_bool;
};

// Sorted by key.
constexpr ItemInfo k_items[] = {
  {"debug",    "DEBUG",   ConfigItem::debug,    true },
  {"format",   "FORMAT",  ConfigItem::format,   false},
  {"log_file", "LOGFILE", ConfigItem::log_file, false},
};

const ItemInfo*
find_item(std::string_view key)
{
  const auto it = std::find_if(std::begin(k_items),
                               std::end(k_items),
                               [&](const auto& info) { return info.key == key; });
  return it != std::end(k_items) ? it : nullptr;
}

// Value of environment variable `name`, or nothing if unset.
std::optional<std::string_view>
get_env(const std::string& name)
{
  const char* value = getenv(name.c_str());
  return value ? std::optional<std::string_view>(value) : std::nullopt;
}

std::optional<fs::path>
get_env_path(const std::string& name)
{
  const auto value = get_env(name);
  return value && !value->empty() ? std::optional<fs::path>(*value)
                                  : std::nullopt;
}

// A KEY=VALUE setting, or nothing for blank lines and comments.
using Setting = std::optional<std::pair<std::string, std::string>>;

tl::expected<Setting, std::string>
parse_setting(std::string_view line)
{
  const auto stripped = util::strip_whitespace(line);
  if (stripped.empty() || stripped.front() == '#') {
    return Setting();
  }
  const size_t equal_pos = stripped.find('=');
  if (equal_pos == std::string_view::npos) {
    return tl::unexpected(std::string("missing equal sign"));
  }
  return Setting(
    std::in_place,
    std::string(util::strip_whitespace(stripped.substr(0, equal_pos))),
    std::string(util::strip_whitespace(stripped.substr(equal_pos + 1))));
}

bool
parse_bool(std::string_view value, std::string_view env_name, bool negated)
{
  if (env_name.empty()) {
    if (value == "true") {
      return true;
    }
    if (value == "false") {
      return false;
    }
    throw core::Error(FMT("not a boolean value: \"{}\"", value));
  }

  // Any value of a set environment variable means "yes", so values that look
  // like "no" are most likely mistakes.
  const auto lower_value = util::to_lowercase(value);
  if (value == "0" || lower_value == "false" || lower_value == "disable"
      || lower_value == "no") {
    throw core::Error(
      FMT("invalid boolean environment variable value \"{}\" (did you mean to"
          " set \"PDBFLAGS_{}{}=true\"?)",
          value,
          negated ? "" : "NO",
          env_name));
  }
  return !negated;
}

fs::path
default_config_path()
{
  if (const auto xdg_config_home = get_env_path("XDG_CONFIG_HOME")) {
    return *xdg_config_home / "pdbflags" / "pdbflags.conf";
  }
  if (const auto home = get_env_path("HOME")) {
    return *home / ".config" / "pdbflags" / "pdbflags.conf";
  }
  return {};
}

} // namespace

void
Config::read(const std::vector<std::string>& cmdline_config_settings,
             const fs::path& config_path)
{
  std::vector<std::pair<std::string, std::string>> cmdline_settings;
  for (const auto& setting : cmdline_config_settings) {
    const auto parsed = parse_setting(setting);
    if (!parsed) {
      throw core::Error(
        FMT("invalid setting \"{}\": {}", setting, parsed.error()));
    }
    if (*parsed) {
      cmdline_settings.push_back(**parsed);
    }
  }

  if (!config_path.empty()) {
    m_config_path = config_path;
  } else if (const auto env_path = get_env_path("PDBFLAGS_CONFIGPATH")) {
    m_config_path = *env_path;
  } else {
    m_config_path = default_config_path();
  }

  // A missing configuration file is fine.
  if (!m_config_path.empty()) {
    update_from_file(m_config_path);
  }
  update_from_environment();
  update_from_map(cmdline_settings);
}

bool
Config::update_from_file(const fs::path& path)
{
  const auto content = util::read_file(path);
  if (!content) {
    return false;
  }

  std::string_view text = *content;
  size_t line_number = 0;
  while (!text.empty()) {
    const size_t eol = text.find('\n');
    const auto line = text.substr(0, eol);
    text = eol == std::string_view::npos ? std::string_view()
                                         : text.substr(eol + 1);
    ++line_number;

    try {
      const auto setting =
        util::value_or_throw<core::Error>(parse_setting(line));
      if (setting) {
        set_item(setting->first, setting->second, std::nullopt, path.string());
      }
    } catch (const core::Error& e) {
      throw core::Error(FMT("{}:{}: {}", path, line_number, e.what()));
    }
  }
  return true;
}

void
Config::update_from_map(
  const std::vector<std::pair<std::string, std::string>>& settings)
{
  for (const auto& [key, value] : settings) {
    try {
      set_item(key, value, std::nullopt, "command line");
    } catch (const core::Error& e) {
      throw core::Error(
        FMT("when parsing command line config \"{}\": {}", key, e.what()));
    }
  }
}

void
Config::update_from_environment()
{
  for (const auto& info : k_items) {
    for (const bool negated : {false, true}) {
      if (negated && !info.is_bool) {
        continue;
      }
      const auto name =
        FMT("PDBFLAGS_{}{}", negated ? "NO" : "", info.env_name);
      const auto value = get_env(name);
      if (!value) {
        continue;
      }
      try {
        set_item(info.key,
                 *value,
                 EnvVar{info.env_name, negated},
                 "environment");
      } catch (const core::Error& e) {
        throw core::Error(FMT("{}: {}", name, e.what()));
      }
    }
  }
}

std::string
Config::get_string_value(std::string_view key) const
{
  const auto info = find_item(key);
  if (!info) {
    throw core::Error(FMT("unknown configuration option \"{}\"", key));
  }

  switch (info->item) {
  case ConfigItem::debug:
    return m_debug ? "true" : "false";
  case ConfigItem::format:
    return std::string(core::report_format_to_string(m_format));
  case ConfigItem::log_file:
    return m_log_file.string();
  }
  return {};
}

void
Config::visit_items(const ItemVisitor& item_visitor) const
{
  for (const auto& info : k_items) {
    const std::string key(info.key);
    const auto it = m_origins.find(key);
    item_visitor(
      key, get_string_value(key), it != m_origins.end() ? it->second : "default");
  }
}

void
Config::set_item(std::string_view key,
                 std::string_view value,
                 const std::optional<EnvVar>& env_var,
                 const std::string& origin)
{
  const auto info = find_item(key);
  if (!info) {
    // Unknown keys are ignored.
    return;
  }

  switch (info->item) {
  case ConfigItem::debug:
    m_debug = parse_bool(value,
                         env_var ? env_var->name : std::string_view(),
                         env_var && env_var->negated);
    break;

  case ConfigItem::format:
    m_format =
      util::value_or_throw<core::Error>(core::parse_report_format(value));
    break;

  case ConfigItem::log_file:
    m_log_file = value;
    break;
  }

  m_origins.insert_or_assign(std::string(key), origin);
}
