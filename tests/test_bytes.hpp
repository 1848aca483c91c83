/* Copyright (C) 2025 Kevin Exton (kevin.exton@pm.me)
 *
 * nettlesoup is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * nettlesoup is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with nettlesoup.  If not, see <https://www.gnu.org/licenses/>.
 */
// NOLINTBEGIN
#pragma once
#ifndef NETTLESOUP_TEST_BYTES_HPP
#define NETTLESOUP_TEST_BYTES_HPP
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

using bytes_t = std::vector<std::byte>;

// Builds a datagram from raw octets.
inline auto bytes(std::initializer_list<unsigned> octets) -> bytes_t
{
  auto buf = bytes_t();
  for (auto octet : octets)
    buf.push_back(static_cast<std::byte>(octet));
  return buf;
}

// Builds a payload of n bytes with a repeating pattern.
inline auto bytes_of(std::size_t n) -> bytes_t
{
  auto buf = bytes_t(n);
  for (std::size_t i = 0; i < n; ++i)
    buf[i] = static_cast<std::byte>(i % 251);
  return buf;
}

// Appends text (no terminator) to a datagram.
inline auto operator+(bytes_t buf, std::string_view text) -> bytes_t
{
  for (auto chr : text)
    buf.push_back(static_cast<std::byte>(chr));
  return buf;
}

// Appends raw octets to a datagram.
inline auto operator+(bytes_t buf, const bytes_t &tail) -> bytes_t
{
  buf.insert(buf.end(), tail.begin(), tail.end());
  return buf;
}
#endif // NETTLESOUP_TEST_BYTES_HPP
// NOLINTEND
