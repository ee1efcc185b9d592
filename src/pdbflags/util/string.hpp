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

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace util {

// Join the elements of `container` with `delimiter` in between.
template<typename T>
std::string
join(const T& container, std::string_view delimiter)
{
  return fmt::format("{}", fmt::join(container, delimiter));
}

// Parse `value` (surrounding whitespace allowed) as a decimal unsigned integer
// in the range [`min_value`, `max_value`]. `description` names the value in
// the range error message.
tl::expected<uint64_t, std::string>
parse_unsigned(std::string_view value,
               std::optional<uint64_t> min_value = std::nullopt,
               std::optional<uint64_t> max_value = std::nullopt,
               std::string_view description = "integer");

// Split `text` into lines at CR and LF, dropping empty lines.
std::vector<std::string_view> split_lines(std::string_view text);

[[nodiscard]] std::string_view strip_whitespace(std::string_view string);

[[nodiscard]] std::string to_lowercase(std::string_view string);

} // namespace util
