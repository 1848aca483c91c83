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
 * @file tftp_session.hpp
 * @brief This file declares a TFTP session record.
 */
#pragma once
#ifndef NETTLESOUP_TFTP_SESSION_HPP
#define NETTLESOUP_TFTP_SESSION_HPP
#include "tftp_protocol.hpp"

#include <cstdint>
#include <optional>
/** @brief TFTP related utilities. */
namespace nettlesoup {

/**
 * @brief A TFTP session records one exchange between two transfer ids.
 * @details The record counts the messages observed in the exchange and keeps
 * the latest of them. Retransmission, acknowledgement matching and
 * completion are decided by its owner. The record is not synchronized.
 */
class session {
public:
  /** @brief A transfer identifier (the port of one side). */
  using tid_type = std::uint16_t;
  /** @brief The message counter, wraps on overflow. */
  using sequence_type = std::uint16_t;

  /**
   * @brief Starts a new exchange.
   * @param local_tid The local transfer id.
   * @param remote_tid The remote transfer id.
   */
  session(tid_type local_tid, tid_type remote_tid) noexcept
      : local_tid_{local_tid}, remote_tid_{remote_tid}
  {}

  /**
   * @brief Records a message sent or received in the exchange.
   * @param msg The message, which replaces the previous one.
   */
  auto record(message msg) -> void;

  /** @returns The local transfer id. */
  [[nodiscard]] auto local_tid() const noexcept -> tid_type
  {
    return local_tid_;
  }

  /** @returns The remote transfer id. */
  [[nodiscard]] auto remote_tid() const noexcept -> tid_type
  {
    return remote_tid_;
  }

  /** @returns The number of messages recorded so far. */
  [[nodiscard]] auto sequence() const noexcept -> sequence_type
  {
    return sequence_;
  }

  /** @returns A copy of the latest message, if any. */
  [[nodiscard]] auto last_message() const -> std::optional<message>
  {
    return last_message_;
  }

private:
  /** @brief The local transfer id. */
  tid_type local_tid_;
  /** @brief The remote transfer id. */
  tid_type remote_tid_;
  /** @brief The message counter. */
  sequence_type sequence_ = 0;
  /** @brief The latest message. */
  std::optional<message> last_message_;
};

} // namespace nettlesoup
#endif // NETTLESOUP_TFTP_SESSION_HPP
