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
 * @file argument_parser.hpp
 * @brief This file declares a CLI argument parser.
 */
#pragma once
#ifndef NETTLESOUP_ARGUMENT_PARSER_HPP
#define NETTLESOUP_ARGUMENT_PARSER_HPP
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>
/** @brief For internal nettlesoup implementation details. */
namespace nettlesoup::detail {
/** @brief A command line argument parser. */
struct argument_parser {
  /**
   * @brief Command-line arguments are parsed into options.
   * @details A positional argument has an empty flag. A flag made only of
   * dashes never takes a value.
   */
  struct option {
    /** @brief option flag. */
    std::string_view flag;
    /** @brief option value. */
    std::string_view value;
  };
  /**
   * @brief Parse all command-line arguments.
   * @param args The command line arguments to parse, program name first.
   * @returns The options in command-line order.
   */
  static auto parse(std::span<char const *const> args) -> std::vector<option>;
  /**
   * @brief Parse all command-line arguments.
   * @param argc The number of command-line arguments.
   * @param argv The command-line arguments.
   * @returns The options in command-line order.
   */
  static auto parse(int argc, char const *const *argv) -> std::vector<option>
  {
    return parse({argv, static_cast<std::size_t>(argc)});
  }
};
} // namespace nettlesoup::detail
#endif // NETTLESOUP_ARGUMENT_PARSER_HPP
