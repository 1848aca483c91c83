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
 * @file parse_error.hpp
 * @brief This file declares the errors reported when decoding TFTP messages.
 */
#pragma once
#ifndef NETTLESOUP_PARSE_ERROR_HPP
#define NETTLESOUP_PARSE_ERROR_HPP
#include <system_error>
/** @brief TFTP related utilities. */
namespace nettlesoup {
/**
 * @brief Reasons a datagram could not be decoded into a message.
 * @details None of these are recoverable without new input. Zero is
 * reserved for success.
 */
enum class parse_error : int {
  /** @brief The datagram is shorter than the message kind allows. */
  TOO_SHORT = 1,
  /** @brief The datagram is longer than the message kind allows. */
  TOO_LONG,
  /** @brief The opcode is unknown or belongs to another message kind. */
  INVALID_OPCODE,
  /** @brief The request filename is empty. */
  NO_FILENAME,
  /** @brief The request filename is not null terminated. */
  INVALID_FILENAME,
  /** @brief The request carries no transfer mode. */
  NO_MODE,
  /** @brief The transfer mode is not netascii, octet or mail. */
  INVALID_MODE,
  /** @brief Reserved for range checks on the error code field. */
  INVALID_ERROR_CODE,
  /** @brief The error message is empty. */
  NO_ERROR_MESSAGE,
  /** @brief The error message is not null terminated. */
  INVALID_ERROR_MESSAGE
};

/**
 * @brief Returns the error category of parse_error.
 * @returns A reference to the singleton category object.
 */
auto parse_category() noexcept -> const std::error_category &;

/**
 * @brief Makes an error code from a parse error.
 * @param err The parse error.
 * @returns An error code in the parse category.
 */
inline auto make_error_code(parse_error err) noexcept -> std::error_code
{
  return {static_cast<int>(err), parse_category()};
}
} // namespace nettlesoup

template <>
struct std::is_error_code_enum<nettlesoup::parse_error> : std::true_type {};

#endif // NETTLESOUP_PARSE_ERROR_HPP
