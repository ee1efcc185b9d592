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

#include <type_traits>
#include <utility>

namespace util {

// Unwrap a `tl::expected`, throwing `E` constructed from the error if there is
// no value.
template<typename E, typename T>
typename std::remove_reference_t<T>::value_type
value_or_throw(T&& value)
{
  if (!value) {
    throw E(value.error());
  }
  return *std::forward<T>(value);
}

// Throw `E` constructed from the error of `value`, if any.
template<typename E, typename T>
void
throw_on_error(const T& value)
{
  if (!value) {
    throw E(value.error());
  }
}

} // namespace util
