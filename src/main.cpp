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
#include "nettlesoup/config.hpp"
#include "nettlesoup/protocol/tftp_protocol.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>

using namespace nettlesoup;

auto main(int argc, char *argv[]) -> int
{
  auto conf = parse_args(argc, argv, std::cout, std::cerr);
  if (!conf)
    return EXIT_SUCCESS;

  spdlog::set_level(conf->log_level);

  spdlog::info("TFTP server configured for [{}]:{}, serving {}.", conf->listen,
               conf->port, conf->root.string());
  spdlog::debug("Maximum datagram size is {} bytes.",
                messages::DATAMSG_MAXLEN);
  return EXIT_SUCCESS;
}
