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
 * @file tftp_session.cpp
 * @brief This file defines the TFTP session record.
 */
#include "nettlesoup/protocol/tftp_session.hpp"

#include <utility>
namespace nettlesoup {

auto session::record(message msg) -> void
{
  last_message_ = std::move(msg);
  ++sequence_; // sequence wraps on overflow.
}

} // namespace nettlesoup
