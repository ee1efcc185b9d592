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

#include "string.hpp"

#include <pdbflags/util/format.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace util {

tl::expected<uint64_t, std::string>
parse_unsigned(std::string_view value,
               const std::optional<uint64_t> min_value,
               const std::optional<uint64_t> max_value,
               const std::string_view description)
{
  const auto digits = strip_whitespace(value);

  uint64_t result = 0;
  const auto end = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(digits.data(), end, result);
  if (digits.empty() || ec != std::errc() || ptr != end) {
    return tl::unexpected(FMT("invalid unsigned integer: \"{}\"", digits));
  }

  const uint64_t min = min_value.value_or(0);
  const uint64_t max = max_value.value_or(UINT64_MAX);
  if (result < min || result > max) {
    return tl::unexpected(
      FMT("{} must be between {} and {}", description, min, max));
  }
  return result;
}

std::vector<std::string_view>
split_lines(std::string_view text)
{
  std::vector<std::string_view> lines;
  while (!text.empty()) {
    const size_t eol = text.find_first_of("\r\n");
    const auto line = text.substr(0, eol);
    if (!line.empty()) {
      lines.push_back(line);
    }
    if (eol == std::string_view::npos) {
      break;
    }
    text.remove_prefix(eol + 1);
  }
  return lines;
}

std::string_view
strip_whitespace(std::string_view string)
{
  const auto is_space = [](unsigned char ch) { return std::isspace(ch); };
  while (!string.empty() && is_space(string.front())) {
    string.remove_prefix(1);
  }
  while (!string.empty() && is_space(string.back())) {
    string.remove_suffix(1);
  }
  return string;
}

std::string
to_lowercase(std::string_view string)
{
  std::string result(string);
  for (auto& ch : result) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return result;
}

} // namespace util
