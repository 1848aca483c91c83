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
 * @file config.cpp
 * @brief This file defines the TFTP server configuration parser.
 */
#include "nettlesoup/config.hpp"
#include "nettlesoup/detail/argument_parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
namespace nettlesoup {

static constexpr char const *const usage =
    "usage: {} [-l <ADDRESS>] [-p <PORT>] [-v] [--log-level=<LEVEL>] ROOT\n"
    "\n"
    "Arguments:\n"
    "ROOT                               the directory to confine requests "
    "to.\n"
    "\n"
    "Options:\n"
    "-h, --help                         print this help.\n"
    "-l, --listen=<ADDRESS>             set the local address to listen on "
    "(default: ::).\n"
    "-p, --port=<PORT>                  set the port to listen on (default: "
    "69).\n"
    "-v, --verbose                      enable verbose logging.\n"
    "--log-level=<LEVEL>                set the log-level (critical, error, "
    "warn, info, debug)\n";

/** @brief Checks that the address is a numeric IPv4 or IPv6 address. */
static inline auto valid_address(const std::string &address) noexcept -> bool
{
  auto buf = std::array<unsigned char, sizeof(in6_addr)>{};
  return inet_pton(AF_INET6, address.c_str(), buf.data()) == 1 ||
         inet_pton(AF_INET, address.c_str(), buf.data()) == 1;
}

auto to_loglevel(std::string_view value)
    -> std::optional<spdlog::level::level_enum>
{
  using std::tolower;
  auto level = std::string(value);
  std::ranges::transform(level, level.begin(), [](unsigned char chr) {
    return static_cast<char>(tolower(chr));
  });

  auto spdlog_level = spdlog::level::from_str(level);
  if (spdlog_level != spdlog::level::off || level == "off")
    return spdlog_level;

  return std::nullopt;
}

// NOLINTNEXTLINE
auto parse_args(int argc, char const *const *argv, std::ostream &out,
                std::ostream &err) -> std::optional<config>
{
  using namespace nettlesoup::detail;

  auto conf = config();
  auto progname = std::filesystem::path(argc > 0 ? *argv : "tftpd").stem();

  auto error = [&]() -> std::optional<config> {
    err << std::format(usage, progname.string());
    return std::nullopt;
  };

  auto set_root = [&](std::string_view value) -> bool {
    if (!conf.root.empty())
    {
      err << std::format("Unexpected argument: {}\n", value);
      return false;
    }
    conf.root = std::filesystem::path(value);
    return true;
  };

  for (const auto &option : argument_parser::parse(argc, argv))
  {
    const auto &[flag, value] = option;
    if (flag.empty()) // positional arguments.
    {
      if (!set_root(value))
        return error();

      continue;
    }

    if (flag == "-h" || flag == "--help")
    {
      out << std::format(usage, progname.string());
      return std::nullopt;
    }

    if (flag == "-l" || flag == "--listen")
    {
      conf.listen = std::string(value);
      if (!valid_address(conf.listen))
      {
        err << std::format("Invalid listen address: {}\n", value);
        return error();
      }
    }
    else if (flag == "-p" || flag == "--port")
    {
      auto [ptr, ec] = std::from_chars(value.data(),
                                       value.data() + value.size(), conf.port);
      if (ec != std::errc{} || ptr != value.data() + value.size())
      {
        err << std::format("Invalid port number: {}\n", value);
        return error();
      }
    }
    else if (flag == "-v" || flag == "--verbose")
    {
      // The flag takes no value, so the parser hands it the next positional.
      if (!value.empty() && !set_root(value))
        return error();

      conf.log_level = std::min(conf.log_level, spdlog::level::debug);
    }
    else if (flag == "--log-level")
    {
      auto level = to_loglevel(value);
      if (!level)
      {
        err << std::format("Unrecognized log level: {}\n", value);
        return error();
      }
      conf.log_level = *level;
    }
    else
    {
      err << std::format("Unknown flag: {}\n", flag);
      return error();
    }
  }

  if (conf.root.empty())
  {
    err << "Missing ROOT directory.\n";
    return error();
  }

  auto ec = std::error_code();
  if (!std::filesystem::is_directory(conf.root, ec))
  {
    err << std::format("Not a directory: {}\n", conf.root.string());
    return error();
  }

  return {conf};
}

} // namespace nettlesoup
