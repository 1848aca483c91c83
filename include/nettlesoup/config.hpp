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
 * @file config.hpp
 * @brief This file declares the TFTP server configuration.
 */
#pragma once
#ifndef NETTLESOUP_CONFIG_HPP
#define NETTLESOUP_CONFIG_HPP
#include <spdlog/common.h>

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
/** @namespace For top-level nettlesoup services. */
namespace nettlesoup {
/** @brief The well-known TFTP port. */
static constexpr unsigned short PORT = 69;

/** @brief The server configuration. */
struct config {
  /** @brief The directory that requests are confined to. */
  std::filesystem::path root;
  /** @brief The local address to listen on. */
  std::string listen = "::";
  /** @brief The local UDP port to listen on. */
  unsigned short port = PORT;
  /** @brief The log level. */
  spdlog::level::level_enum log_level = spdlog::level::info;
};

/**
 * @brief Parses a log level name, ignoring case.
 * @param value The level name (e.g. "debug").
 * @returns The level or std::nullopt if the name is not an spdlog level.
 */
auto to_loglevel(std::string_view value)
    -> std::optional<spdlog::level::level_enum>;

/**
 * @brief Parses the command line.
 * @details Diagnostics and the usage text go to err. The help text goes to
 * out.
 * @param argc The number of command-line arguments.
 * @param argv The command-line arguments.
 * @param out The stream for requested output.
 * @param err The stream for diagnostics.
 * @returns The configuration, or std::nullopt if the program should exit.
 */
auto parse_args(int argc, char const *const *argv, std::ostream &out,
                std::ostream &err) -> std::optional<config>;

} // namespace nettlesoup
#endif // NETTLESOUP_CONFIG_HPP
