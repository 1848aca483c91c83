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
 * @file codec.hpp
 * @brief This file declares the TFTP wire encoder and decoders.
 *
 * All functions are pure: they touch nothing but their arguments and may be
 * called concurrently from any number of threads.
 */
#pragma once
#ifndef NETTLESOUP_CODEC_HPP
#define NETTLESOUP_CODEC_HPP
#include "parse_error.hpp"
#include "tftp_protocol.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <system_error>
#include <vector>
/** @brief TFTP related utilities. */
namespace nettlesoup {

/**
 * @brief Encodes a message into one datagram.
 * @details The layouts are, with all integers big-endian:
 * - RRQ/WRQ: [opcode][filename][0x00][mode]
 * - DATA:    [opcode][block_num][payload]
 * - ACK:     [opcode][block_num]
 * - ERROR:   [opcode][code][message][0x00]
 *
 * Text is copied one byte per character. The caller is responsible for
 * passing a well-formed message (see is_well_formed).
 * @param msg The message to encode.
 * @returns The bytes of the datagram.
 */
auto encode(const message &msg) -> std::vector<std::byte>;

/**
 * @brief Decodes a datagram, dispatching on its opcode.
 * @param buf The datagram.
 * @param[out] err Cleared on success, set to a parse_error on failure.
 * @returns The message, or std::nullopt if err is set.
 */
auto decode(std::span<const std::byte> buf,
            std::error_code &err) -> std::optional<message>;

/**
 * @brief Decodes a datagram that must hold an RRQ.
 * @param buf The datagram.
 * @param[out] err Cleared on success, set to a parse_error on failure.
 * @returns The request, or std::nullopt if err is set.
 */
auto decode_rrq(std::span<const std::byte> buf, std::error_code &err)
    -> std::optional<messages::read_request>;

/**
 * @brief Decodes a datagram that must hold a WRQ.
 * @param buf The datagram.
 * @param[out] err Cleared on success, set to a parse_error on failure.
 * @returns The request, or std::nullopt if err is set.
 */
auto decode_wrq(std::span<const std::byte> buf, std::error_code &err)
    -> std::optional<messages::write_request>;

/**
 * @brief Decodes a datagram that must hold a DATA block.
 * @details The datagram must be 5 to DATAMSG_MAXLEN bytes long. Everything
 * after the header is payload.
 * @param buf The datagram.
 * @param[out] err Cleared on success, set to a parse_error on failure.
 * @returns The data block, or std::nullopt if err is set.
 */
auto decode_data(std::span<const std::byte> buf,
                 std::error_code &err) -> std::optional<messages::data>;

/**
 * @brief Decodes a datagram that must hold an ACK.
 * @details The datagram must be exactly 4 bytes long.
 * @param buf The datagram.
 * @param[out] err Cleared on success, set to a parse_error on failure.
 * @returns The acknowledgement, or std::nullopt if err is set.
 */
auto decode_ack(std::span<const std::byte> buf,
                std::error_code &err) -> std::optional<messages::ack>;

/**
 * @brief Decodes a datagram that must hold an ERROR.
 * @param buf The datagram.
 * @param[out] err Cleared on success, set to a parse_error on failure.
 * @returns The error notice, or std::nullopt if err is set.
 */
auto decode_error(std::span<const std::byte> buf,
                  std::error_code &err) -> std::optional<messages::error>;

} // namespace nettlesoup
#endif // NETTLESOUP_CODEC_HPP
