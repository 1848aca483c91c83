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
/**
 * @file endian.hpp
 * @brief This file defines constexpr host to network byte-order conversions
 * and big-endian field access on byte buffers.
 */
#pragma once
#ifndef NETTLESOUP_ENDIAN_HPP
#define NETTLESOUP_ENDIAN_HPP
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
/** @brief Defines internal nettlesoup implementation details. */
namespace nettlesoup::detail {
// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
/**
 * @brief Converts a 16-bit unsigned integer from host to network byte order.
 * @param hostshort The 16-bit unsigned integer in host byte order.
 * @returns The 16-bit unsigned integer in network byte order.
 */
constexpr auto htons_(const std::uint16_t hostshort) noexcept -> std::uint16_t
{
  if constexpr (std::endian::native == std::endian::little)
  {
    return static_cast<std::uint16_t>((hostshort << 8) | (hostshort >> 8));
  }
  return hostshort;
}

/**
 * @brief Converts a 16-bit unsigned integer from network to host byte order.
 * @param netshort The 16-bit unsigned integer in network byte order.
 * @returns The 16-bit unsigned integer in host byte order.
 */
constexpr auto ntohs_(const std::uint16_t netshort) noexcept -> std::uint16_t
{
  if constexpr (std::endian::native == std::endian::little)
  {
    return static_cast<std::uint16_t>((netshort >> 8) | (netshort << 8));
  }
  return netshort;
}

/**
 * @brief Reads a big-endian 16-bit field.
 * @param buf The buffer, which must hold at least offset + 2 bytes.
 * @param offset The offset of the field's first byte.
 * @returns The field in host byte order.
 */
constexpr auto load_u16(std::span<const std::byte> buf,
                        std::size_t offset) noexcept -> std::uint16_t
{
  const auto bytes = std::array<std::byte, 2>{buf[offset], buf[offset + 1]};
  return ntohs_(std::bit_cast<std::uint16_t>(bytes));
}

/**
 * @brief Appends a 16-bit value to a buffer in network byte order.
 * @param buf The buffer to append to.
 * @param value The value in host byte order.
 */
inline auto store_u16(std::vector<std::byte> &buf,
                      const std::uint16_t value) -> void
{
  const auto bytes = std::bit_cast<std::array<std::byte, 2>>(htons_(value));
  buf.insert(buf.end(), bytes.begin(), bytes.end());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
} // namespace nettlesoup::detail
#endif // NETTLESOUP_ENDIAN_HPP
