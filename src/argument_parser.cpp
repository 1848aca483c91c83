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
 * @file argument_parser.cpp
 * @brief This file implements a CLI argument parser.
 */
#include "nettlesoup/detail/argument_parser.hpp"

#include <algorithm>
namespace nettlesoup::detail {

/** @brief Flags such as "-" or "--" stand alone. */
static inline auto takes_value(std::string_view flag) noexcept -> bool
{
  // NOLINTNEXTLINE(readability-identifier-length)
  return !std::ranges::all_of(flag, [](char ch) { return ch == '-'; });
}

auto argument_parser::parse(std::span<char const *const> args)
    -> std::vector<option>
{
  auto options = std::vector<option>();
  if (args.empty())
    return options;

  auto opt = option{};
  auto pending = false;
  auto flush = [&]() {
    if (pending)
      options.push_back(opt);

    opt = option{};
    pending = false;
  };

  for (const auto *arg : args.subspan(1))
  {
    auto token = std::string_view(arg);
    if (!token.empty() && token.front() == '-') // short option.
    {
      flush();
      opt.flag = token;
      pending = true;

      if (token.size() > 2 && token[1] == '-') // long option.
      {
        if (auto delim = token.find('='); delim != std::string_view::npos)
        {
          opt.flag = token.substr(0, delim);
          opt.value = token.substr(delim + 1);
        }
      }
      continue;
    }

    if (pending && opt.value.empty() && takes_value(opt.flag))
    {
      opt.value = token;
      flush();
      continue;
    }

    flush();
    opt.value = token;
    pending = true;
  }

  flush();
  return options;
}
} // namespace nettlesoup::detail
