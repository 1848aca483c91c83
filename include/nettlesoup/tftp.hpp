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
 * @file tftp.hpp
 * @brief This file declares the glue between a transport and a session.
 */
#pragma once
#ifndef NETTLESOUP_TFTP_HPP
#define NETTLESOUP_TFTP_HPP
#include "protocol/codec.hpp"
#include "protocol/tftp_protocol.hpp"
#include "protocol/tftp_session.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <system_error>
#include <vector>
/** @namespace For top-level nettlesoup services. */
namespace nettlesoup {

/**
 * @brief Processes a datagram received in an exchange.
 * @details The decoded message is recorded in the session. A datagram that
 * does not decode leaves the session untouched.
 * @param sess The session of the exchange.
 * @param buf The datagram.
 * @param[out] err Cleared on success, set to a parse_error otherwise.
 * @returns The message, or std::nullopt if err is set.
 */
auto receive(session &sess, std::span<const std::byte> buf,
             std::error_code &err) -> std::optional<message>;

/**
 * @brief Prepares a message to be sent in an exchange.
 * @details The message is recorded in the session before it is encoded.
 * @param sess The session of the exchange.
 * @param msg A well-formed message.
 * @returns The datagram to send.
 */
auto send(session &sess, const message &msg) -> std::vector<std::byte>;

} // namespace nettlesoup
#endif // NETTLESOUP_TFTP_HPP
