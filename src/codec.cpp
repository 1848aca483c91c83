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
 * @file codec.cpp
 * @brief This file defines the TFTP wire encoder and decoders.
 */
#include "nettlesoup/protocol/codec.hpp"
#include "nettlesoup/detail/endian.hpp"

#include <string>
#include <string_view>
#include <utility>
namespace nettlesoup {
namespace {
/** @brief The error category of parse_error. */
class parse_category_t final : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override
  {
    return "tftp.parse";
  }

  [[nodiscard]] auto message(int err) const -> std::string override
  {
    using enum parse_error;
    switch (static_cast<parse_error>(err))
    {
      case TOO_SHORT:
        return "Message too short.";

      case TOO_LONG:
        return "Message too long.";

      case INVALID_OPCODE:
        return "Invalid opcode.";

      case NO_FILENAME:
        return "No filename.";

      case INVALID_FILENAME:
        return "Invalid filename.";

      case NO_MODE:
        return "No transfer mode.";

      case INVALID_MODE:
        return "Invalid transfer mode.";

      case INVALID_ERROR_CODE:
        return "Invalid error code.";

      case NO_ERROR_MESSAGE:
        return "No error message.";

      case INVALID_ERROR_MESSAGE:
        return "Invalid error message.";

      default:
        return "Unknown parse error.";
    }
  }
};

/** @brief A string field read off the wire. */
struct field {
  /** @brief The field text without its terminator. */
  std::string_view text;
  /** @brief The offset following the terminator. */
  std::size_t next = 0;
  /** @brief false if the buffer ended before a null byte. */
  bool terminated = false;
};

/**
 * @brief Reads bytes up to and including the next null byte.
 * @details The bounds are checked before every access, so a truncated
 * buffer yields an unterminated field holding the remaining bytes.
 * @param buf The datagram.
 * @param offset Where the field starts.
 * @returns The field.
 */
[[nodiscard]] auto scan_field(std::span<const std::byte> buf,
                              std::size_t offset) noexcept -> field
{
  auto pos = offset;
  while (pos < buf.size() && buf[pos] != std::byte{0})
    ++pos;

  auto result = field{.next = pos, .terminated = pos < buf.size()};
  if (pos > offset)
  {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto *str = reinterpret_cast<const char *>(buf.data()) + offset;
    result.text = std::string_view(str, pos - offset);
  }

  if (result.terminated)
    ++result.next;

  return result;
}

/**
 * @brief Checks the opcode at the start of a datagram.
 * @param buf The datagram, at least OPCODE_LEN bytes long.
 * @param expected The opcode of the message kind being decoded.
 * @param[out] err Set to INVALID_OPCODE on a mismatch.
 * @returns true if the opcode matches.
 */
auto check_opcode(std::span<const std::byte> buf, messages::opcode_t expected,
                  std::error_code &err) noexcept -> bool
{
  auto opc = to_opcode(detail::load_u16(buf, 0));
  if (!opc || *opc != expected)
  {
    err = parse_error::INVALID_OPCODE;
    return false;
  }
  return true;
}

/** @brief Decodes the shared RRQ/WRQ layout. */
template <typename Request>
auto decode_request(std::span<const std::byte> buf,
                    messages::opcode_t expected,
                    std::error_code &err) -> std::optional<Request>
{
  using enum parse_error;
  err.clear();

  if (buf.size() < messages::REQUEST_MINLEN)
  {
    err = TOO_SHORT;
    return std::nullopt;
  }

  if (!check_opcode(buf, expected, err))
    return std::nullopt;

  const auto filename = scan_field(buf, messages::OPCODE_LEN);
  if (!filename.terminated)
  {
    err = INVALID_FILENAME;
    return std::nullopt;
  }

  if (filename.text.empty())
  {
    err = NO_FILENAME;
    return std::nullopt;
  }

  // The mode runs to its terminator or to the end of the datagram.
  const auto mode = scan_field(buf, filename.next);
  if (mode.text.empty())
  {
    err = NO_MODE;
    return std::nullopt;
  }

  auto value = to_mode(mode.text);
  if (!value)
  {
    err = INVALID_MODE;
    return std::nullopt;
  }

  return Request{.filename = std::string(filename.text), .mode = *value};
}

/** @brief Appends a string field to an outbound datagram. */
auto store_text(std::vector<std::byte> &buf, std::string_view text) -> void
{
  for (const auto chr : text)
    buf.push_back(static_cast<std::byte>(chr));
}

/** @brief Writes each message kind into an outbound datagram. */
struct encoder {
  std::vector<std::byte> &buf;

  auto operator()(const messages::read_request &req) const -> void
  {
    detail::store_u16(buf, messages::RRQ);
    store_text(buf, req.filename);
    buf.push_back(std::byte{0});
    store_text(buf, to_string(req.mode));
  }

  auto operator()(const messages::write_request &req) const -> void
  {
    detail::store_u16(buf, messages::WRQ);
    store_text(buf, req.filename);
    buf.push_back(std::byte{0});
    store_text(buf, to_string(req.mode));
  }

  auto operator()(const messages::data &data) const -> void
  {
    detail::store_u16(buf, messages::DATA);
    detail::store_u16(buf, data.block_num);
    buf.insert(buf.end(), data.payload.begin(), data.payload.end());
  }

  auto operator()(const messages::ack &ack) const -> void
  {
    detail::store_u16(buf, messages::ACK);
    detail::store_u16(buf, ack.block_num);
  }

  auto operator()(const messages::error &error) const -> void
  {
    detail::store_u16(buf, messages::ERROR);
    detail::store_u16(buf, error.code);
    store_text(buf, error.message);
    buf.push_back(std::byte{0});
  }
};
} // namespace

auto parse_category() noexcept -> const std::error_category &
{
  static const auto category = parse_category_t{};
  return category;
}

auto encode(const message &msg) -> std::vector<std::byte>
{
  auto buf = std::vector<std::byte>();
  buf.reserve(messages::DATAMSG_MAXLEN);
  std::visit(encoder{buf}, msg);
  return buf;
}

auto decode_rrq(std::span<const std::byte> buf, std::error_code &err)
    -> std::optional<messages::read_request>
{
  return decode_request<messages::read_request>(buf, messages::RRQ, err);
}

auto decode_wrq(std::span<const std::byte> buf, std::error_code &err)
    -> std::optional<messages::write_request>
{
  return decode_request<messages::write_request>(buf, messages::WRQ, err);
}

auto decode_data(std::span<const std::byte> buf,
                 std::error_code &err) -> std::optional<messages::data>
{
  using enum parse_error;
  err.clear();

  if (buf.size() <= messages::HEADER_LEN)
  {
    err = TOO_SHORT;
    return std::nullopt;
  }

  if (!check_opcode(buf, messages::DATA, err))
    return std::nullopt;

  if (buf.size() > messages::DATAMSG_MAXLEN)
  {
    err = TOO_LONG;
    return std::nullopt;
  }

  auto payload = buf.subspan(messages::HEADER_LEN);
  return messages::data{
      .block_num = detail::load_u16(buf, messages::OPCODE_LEN),
      .payload = std::vector<std::byte>(payload.begin(), payload.end())};
}

auto decode_ack(std::span<const std::byte> buf,
                std::error_code &err) -> std::optional<messages::ack>
{
  using enum parse_error;
  err.clear();

  if (buf.size() < messages::HEADER_LEN)
  {
    err = TOO_SHORT;
    return std::nullopt;
  }

  if (!check_opcode(buf, messages::ACK, err))
    return std::nullopt;

  if (buf.size() > messages::HEADER_LEN)
  {
    err = TOO_LONG;
    return std::nullopt;
  }

  return messages::ack{.block_num =
                           detail::load_u16(buf, messages::OPCODE_LEN)};
}

auto decode_error(std::span<const std::byte> buf,
                  std::error_code &err) -> std::optional<messages::error>
{
  using enum parse_error;
  err.clear();

  if (buf.size() < messages::ERRORMSG_MINLEN)
  {
    err = TOO_SHORT;
    return std::nullopt;
  }

  if (!check_opcode(buf, messages::ERROR, err))
    return std::nullopt;

  // TODO: Reject codes outside error_t with INVALID_ERROR_CODE once a
  // policy for vendor specific codes is settled.
  const auto code = detail::load_u16(buf, messages::OPCODE_LEN);

  const auto text = scan_field(buf, messages::HEADER_LEN);
  if (!text.terminated)
  {
    err = INVALID_ERROR_MESSAGE;
    return std::nullopt;
  }

  if (text.text.empty())
  {
    err = NO_ERROR_MESSAGE;
    return std::nullopt;
  }

  return messages::error{.code = code, .message = std::string(text.text)};
}

auto decode(std::span<const std::byte> buf,
            std::error_code &err) -> std::optional<message>
{
  using enum messages::opcode_t;
  err.clear();

  if (buf.size() < messages::OPCODE_LEN)
  {
    err = parse_error::TOO_SHORT;
    return std::nullopt;
  }

  auto opc = to_opcode(detail::load_u16(buf, 0));
  if (!opc)
  {
    err = parse_error::INVALID_OPCODE;
    return std::nullopt;
  }

  // Widens the decoded alternative into a message.
  auto widen = [](auto &&msg) -> std::optional<message> {
    if (!msg)
      return std::nullopt;

    return message{std::move(*msg)};
  };

  switch (*opc)
  {
    case RRQ:
      return widen(decode_rrq(buf, err));

    case WRQ:
      return widen(decode_wrq(buf, err));

    case DATA:
      return widen(decode_data(buf, err));

    case ACK:
      return widen(decode_ack(buf, err));

    case ERROR:
      return widen(decode_error(buf, err));
  }

  err = parse_error::INVALID_OPCODE; // GCOVR_EXCL_LINE
  return std::nullopt;               // GCOVR_EXCL_LINE
}

} // namespace nettlesoup
