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
 * @file tftp_protocol.hpp
 * @brief This file declares the TFTP message model and protocol definitions.
 */
#pragma once
#ifndef NETTLESOUP_TFTP_PROTOCOL_HPP
#define NETTLESOUP_TFTP_PROTOCOL_HPP
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
/** @brief TFTP related utilities. */
namespace nettlesoup {
// NOLINTBEGIN(performance-enum-size)
/** @brief A struct to contain TFTP message types and protocol definitions. */
struct messages {
  /**
   * @brief Protocol defined operations (opcodes).
   * These are the valid TFTP operation codes as defined in RFC 1350.
   */
  enum opcode_t : std::uint16_t { RRQ = 1, WRQ, DATA, ACK, ERROR };

  /**
   * @brief Protocol defined transfer modes.
   * These are the supported TFTP transfer modes as defined in RFC 1350.
   */
  enum mode_t : std::uint8_t { NETASCII = 1, OCTET, MAIL };

  /**
   * @brief Protocol defined error codes.
   * These are the standard TFTP error codes as defined in RFC 1350.
   */
  enum error_t : std::uint16_t {
    NOT_DEFINED = 0,
    FILE_NOT_FOUND,
    ACCESS_VIOLATION,
    DISK_FULL,
    ILLEGAL_OPERATION,
    UNKNOWN_TID,
    FILE_ALREADY_EXISTS,
    NO_SUCH_USER,
    // Errors below this point are all ALIASES to NOT_DEFINED.
    TIMED_OUT
  };

  /** @brief A read request (RRQ). */
  struct read_request {
    /** @brief The requested file. Non-empty, no embedded null byte. */
    std::string filename;
    /** @brief The transfer mode. */
    mode_t mode = OCTET;

    auto operator==(const read_request &) const -> bool = default;
  };

  /** @brief A write request (WRQ). */
  struct write_request {
    /** @brief The file to write. Non-empty, no embedded null byte. */
    std::string filename;
    /** @brief The transfer mode. */
    mode_t mode = OCTET;

    auto operator==(const write_request &) const -> bool = default;
  };

  /** @brief A data block (DATA). */
  struct data {
    /** @brief Block number (starts at 1). */
    std::uint16_t block_num = 0;
    /** @brief At most DATALEN bytes of file content. */
    std::vector<std::byte> payload;

    auto operator==(const data &) const -> bool = default;
  };

  /** @brief An acknowledgement (ACK). */
  struct ack {
    /** @brief The acknowledged block number. */
    std::uint16_t block_num = 0;

    auto operator==(const ack &) const -> bool = default;
  };

  /** @brief An error notice (ERROR). */
  struct error {
    /** @brief Error code, usually one of error_t. */
    std::uint16_t code = NOT_DEFINED;
    /** @brief Non-empty message text, no embedded null byte. */
    std::string message;

    auto operator==(const error &) const -> bool = default;
  };

  /** @brief The size of the opcode field. */
  static constexpr auto OPCODE_LEN = sizeof(std::uint16_t);
  /** @brief The size of the opcode and block number (or error code). */
  static constexpr auto HEADER_LEN = 2 * sizeof(std::uint16_t);
  /** @brief The maximum data payload size in bytes (512 bytes per RFC 1350). */
  static constexpr auto DATALEN = 512UL;
  /** @brief The maximum total size of a DATA message (header + payload). */
  static constexpr auto DATAMSG_MAXLEN = HEADER_LEN + DATALEN;
  /** @brief The minimum size of an RRQ/WRQ: the opcode and one field byte. */
  static constexpr auto REQUEST_MINLEN = OPCODE_LEN + 1;
  /** @brief The minimum size of an ERROR: header and a single text byte. */
  static constexpr auto ERRORMSG_MINLEN = HEADER_LEN + 1;
};
// NOLINTEND(performance-enum-size)

/**
 * @brief A TFTP message.
 * @details The alternative index follows the opcode order, so a new message
 * kind is added by extending both messages::opcode_t and this variant.
 */
using message =
    std::variant<messages::read_request, messages::write_request,
                 messages::data, messages::ack, messages::error>;

/**
 * @brief Returns the opcode of a message.
 * @param msg The message.
 * @returns The opcode that tags msg on the wire.
 */
auto opcode_of(const message &msg) noexcept -> messages::opcode_t;

/**
 * @brief Maps a raw 16-bit value to an opcode.
 * @param value The value in host byte order.
 * @returns The opcode or std::nullopt if value is not a TFTP opcode.
 */
constexpr auto
to_opcode(std::uint16_t value) noexcept -> std::optional<messages::opcode_t>
{
  using enum messages::opcode_t;
  if (value < RRQ || value > ERROR)
    return std::nullopt;

  return static_cast<messages::opcode_t>(value);
}

/**
 * @brief Converts an opcode to its mnemonic.
 * @param opc The opcode.
 * @returns "RRQ", "WRQ", "DATA", "ACK", "ERROR" or "UNKNOWN".
 */
constexpr auto to_string(messages::opcode_t opc) noexcept -> std::string_view
{
  using enum messages::opcode_t;
  switch (opc)
  {
    case RRQ:
      return "RRQ";

    case WRQ:
      return "WRQ";

    case DATA:
      return "DATA";

    case ACK:
      return "ACK";

    case ERROR:
      return "ERROR";

    default:
      return "UNKNOWN";
  }
}

/**
 * @brief Converts a transfer mode to its wire form.
 * @param mode The transfer mode.
 * @returns The lowercase mode name, empty for an invalid mode.
 */
constexpr auto to_string(messages::mode_t mode) noexcept -> std::string_view
{
  using enum messages::mode_t;
  switch (mode)
  {
    case NETASCII:
      return "netascii";

    case OCTET:
      return "octet";

    case MAIL:
      return "mail";

    default:
      return {};
  }
}

/**
 * @brief Converts a mode name to a transfer mode, ignoring case.
 * @param mode The mode name as read off the wire.
 * @returns The transfer mode or std::nullopt if the name is not recognized.
 */
auto to_mode(std::string_view mode) noexcept
    -> std::optional<messages::mode_t>;

/**
 * @brief Checks that a message can be encoded.
 * @details Text fields must be non-empty and free of null bytes, and a DATA
 * payload must hold between 1 and DATALEN bytes so that it decodes back.
 * @param msg The message to check.
 * @returns true if encode(msg) decodes back to msg.
 */
auto is_well_formed(const message &msg) noexcept -> bool;

/** @brief Error messages. */
struct errors {
  /**
   * @brief Converts a TFTP error to a string.
   * @param error The TFTP error.
   * @returns A string_view containing the relevant error message.
   */
  static constexpr auto errstr(std::uint16_t error) noexcept -> std::string_view
  {
    using enum messages::error_t;
    switch (error)
    {
      case ACCESS_VIOLATION:
        return "Access violation.";

      case FILE_NOT_FOUND:
        return "File not found.";

      case DISK_FULL:
        return "Disk full.";

      case NO_SUCH_USER:
        return "No such user.";

      case FILE_ALREADY_EXISTS:
        return "File already exists.";

      case UNKNOWN_TID:
        return "Unknown TID.";

      case ILLEGAL_OPERATION:
        return "Illegal operation.";

      case TIMED_OUT:
        return "Timed out.";

      default:
        return "Not defined.";
    }
  }

  /**
   * @brief Constructs an ERROR message for a TFTP error.
   * @details Aliases such as TIMED_OUT are sent as NOT_DEFINED with their
   * own text.
   * @param error The error code.
   * @returns An ERROR message carrying errstr(error).
   */
  static auto msg(std::uint16_t error) -> messages::error
  {
    using enum messages::error_t;
    const std::uint16_t code =
        (error > NO_SUCH_USER) ? std::uint16_t{NOT_DEFINED} : error;
    return {.code = code, .message = std::string(errstr(error))};
  }
};

} // namespace nettlesoup
#endif // NETTLESOUP_TFTP_PROTOCOL_HPP
