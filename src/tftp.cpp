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
 * @file tftp.cpp
 * @brief This file defines the glue between a transport and a session.
 */
#include "nettlesoup/tftp.hpp"

#include <spdlog/spdlog.h>
namespace nettlesoup {

auto receive(session &sess, std::span<const std::byte> buf,
             std::error_code &err) -> std::optional<message>
{
  auto msg = decode(buf, err);
  if (!msg)
  {
    spdlog::warn("{}:{}:Rejected {} byte datagram: {}", sess.local_tid(),
                 sess.remote_tid(), buf.size(), err.message());
    return std::nullopt;
  }

  sess.record(*msg);
  spdlog::debug("{}:{}:Received {} (seq {}).", sess.local_tid(),
                sess.remote_tid(), to_string(opcode_of(*msg)),
                sess.sequence());
  return msg;
}

auto send(session &sess, const message &msg) -> std::vector<std::byte>
{
  if (!is_well_formed(msg)) [[unlikely]]
  {
    spdlog::warn("{}:{}:Sending malformed {}.", sess.local_tid(),
                 sess.remote_tid(), to_string(opcode_of(msg)));
  }

  sess.record(msg);
  spdlog::debug("{}:{}:Sent {} (seq {}).", sess.local_tid(),
                sess.remote_tid(), to_string(opcode_of(msg)),
                sess.sequence());
  return encode(msg);
}

} // namespace nettlesoup
