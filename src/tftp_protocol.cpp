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
 * @file tftp_protocol.cpp
 * @brief This file defines the TFTP protocol helpers.
 */
#include "nettlesoup/protocol/tftp_protocol.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
namespace nettlesoup {

/** @brief Text fields must be non-empty and must not embed a null byte. */
static inline auto valid_text(std::string_view text) noexcept -> bool
{
  return !text.empty() && text.find('\0') == std::string_view::npos;
}

auto opcode_of(const message &msg) noexcept -> messages::opcode_t
{
  // Alternatives are declared in opcode order.
  return static_cast<messages::opcode_t>(msg.index() + 1);
}

auto to_mode(std::string_view mode) noexcept -> std::optional<messages::mode_t>
{
  using enum messages::mode_t;
  constexpr auto BUFSIZE = sizeof("netascii") - 1;

  if (mode.size() > BUFSIZE)
    return std::nullopt;

  auto buf = std::array<char, BUFSIZE>{};
  std::transform(mode.begin(), mode.end(), buf.begin(), [](unsigned char chr) {
    return static_cast<char>(std::tolower(chr));
  });

  const auto lower = std::string_view(buf.data(), mode.size());
  for (const auto value : {NETASCII, OCTET, MAIL})
  {
    if (lower == to_string(value))
      return value;
  }

  return std::nullopt;
}

auto is_well_formed(const message &msg) noexcept -> bool
{
  if (const auto *req = std::get_if<messages::read_request>(&msg))
    return valid_text(req->filename) && !to_string(req->mode).empty();

  if (const auto *req = std::get_if<messages::write_request>(&msg))
    return valid_text(req->filename) && !to_string(req->mode).empty();

  if (const auto *data = std::get_if<messages::data>(&msg))
  {
    return !data->payload.empty() &&
           data->payload.size() <= messages::DATALEN;
  }

  if (const auto *error = std::get_if<messages::error>(&msg))
    return valid_text(error->message);

  // ACKs have no variable fields.
  return true;
}

} // namespace nettlesoup
