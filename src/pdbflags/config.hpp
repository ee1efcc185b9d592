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

#include <pdbflags/core/report.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class Config
{
public:
  Config() = default;

  // Read configuration from the configuration file, PDBFLAGS_* environment
  // variables and `cmdline_config_settings` (KEY=VALUE strings), with later
  // sources taking precedence. The configuration file is `config_path` if not
  // empty, otherwise $PDBFLAGS_CONFIGPATH or the default location.
  //
  // Throws core::Error on invalid settings.
  void read(const std::vector<std::string>& cmdline_config_settings = {},
            const std::filesystem::path& config_path = {});

  bool debug() const;
  core::ReportFormat format() const;
  const std::filesystem::path& log_file() const;

  const std::filesystem::path& config_path() const;

  // Return false if `path` can't be read. Throws core::Error on parse errors.
  bool update_from_file(const std::filesystem::path& path);

  void update_from_map(
    const std::vector<std::pair<std::string, std::string>>& settings);

  void update_from_environment();

  // Throws core::Error for unknown keys.
  std::string get_string_value(std::string_view key) const;

  using ItemVisitor = std::function<void(const std::string& key,
                                         const std::string& value,
                                         const std::string& origin)>;

  // Call `item_visitor` for each item, sorted by key.
  void visit_items(const ItemVisitor& item_visitor) const;

private:
  struct EnvVar
  {
    std::string_view name;
    bool negated;
  };

  std::filesystem::path m_config_path;

  bool m_debug = false;
  core::ReportFormat m_format = core::ReportFormat::human;
  std::filesystem::path m_log_file;

  std::map<std::string, std::string, std::less<>> m_origins;

  void set_item(std::string_view key,
                std::string_view value,
                const std::optional<EnvVar>& env_var,
                const std::string& origin);
};

inline bool
Config::debug() const
{
  return m_debug;
}

inline core::ReportFormat
Config::format() const
{
  return m_format;
}

inline const std::filesystem::path&
Config::log_file() const
{
  return m_log_file;
}

inline const std::filesystem::path&
Config::config_path() const
{
  return m_config_path;
}
