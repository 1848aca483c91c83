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
// NOLINTBEGIN
#include "nettlesoup/protocol/codec.hpp"
#include "test_bytes.hpp"

#include <gtest/gtest.h>

using namespace nettlesoup;
using enum parse_error;
static constexpr auto DATAMSG_MAXLEN = messages::DATAMSG_MAXLEN;
static constexpr auto DATALEN = messages::DATALEN;

// =============================================================================
// DATA
// =============================================================================
TEST(TftpDataTest, EncodeData)
{
  const auto buf = encode(messages::data{0x0102, bytes({0xDE, 0xAD, 0x00})});

  EXPECT_EQ(buf, bytes({0x00, 0x03, 0x01, 0x02, 0xDE, 0xAD, 0x00}));
}

TEST(TftpDataTest, EncodeFullBlock)
{
  const auto payload = bytes_of(DATALEN);
  const auto buf = encode(messages::data{7, payload});

  ASSERT_EQ(buf.size(), DATAMSG_MAXLEN);
  EXPECT_EQ(buf, bytes({0x00, 0x03, 0x00, 0x07}) + payload);
}

TEST(TftpDataTest, DecodeKeepsPayloadVerbatim)
{
  // Null bytes inside the payload are data, not terminators.
  const auto buf = bytes({0x00, 0x03, 0xFF, 0xFE, 0x00, 0x0A, 0x00});

  auto err = std::error_code();
  auto data = decode_data(buf, err);

  ASSERT_TRUE(data) << err.message();
  EXPECT_EQ(data->block_num, 0xFFFE);
  EXPECT_EQ(data->payload, bytes({0x00, 0x0A, 0x00}));
}

class TftpDataLengthTest : public ::testing::TestWithParam<std::size_t> {};

TEST_P(TftpDataLengthTest, AcceptsLength)
{
  const auto len = GetParam();
  const auto buf = bytes({0x00, 0x03, 0x00, 0x01}) + bytes_of(len - 4);

  auto err = std::error_code();
  auto data = decode_data(buf, err);

  ASSERT_TRUE(data) << err.message();
  EXPECT_EQ(data->block_num, 1);
  EXPECT_EQ(data->payload.size(), len - 4);
  EXPECT_EQ(encode(*data), buf);
}

INSTANTIATE_TEST_SUITE_P(TftpDataLengthCases, TftpDataLengthTest,
                         ::testing::Values(5, 6, 100, 515, 516));

TEST(TftpDataTest, RejectsHeaderOnly)
{
  auto err = std::error_code();

  EXPECT_FALSE(decode_data(bytes({0x00, 0x03, 0x00, 0x01}), err));
  EXPECT_EQ(err, TOO_SHORT);
}

TEST(TftpDataTest, RejectsShortBuffers)
{
  for (const auto &buf : {bytes({}), bytes({0x00}), bytes({0x00, 0x03}),
                          bytes({0x00, 0x03, 0x00})})
  {
    auto err = std::error_code();
    EXPECT_FALSE(decode_data(buf, err));
    EXPECT_EQ(err, TOO_SHORT) << buf.size();
  }
}

TEST(TftpDataTest, RejectsOversizedBlock)
{
  const auto buf = bytes({0x00, 0x03, 0x00, 0x01}) + bytes_of(DATALEN + 1);
  ASSERT_EQ(buf.size(), 517);

  auto err = std::error_code();
  EXPECT_FALSE(decode_data(buf, err));
  EXPECT_EQ(err, TOO_LONG);
}

TEST(TftpDataTest, OversizedBlockWithOtherOpcode)
{
  // The opcode is checked before the maximum length.
  const auto buf = bytes({0x00, 0x04, 0x00, 0x01}) + bytes_of(DATALEN + 1);
  ASSERT_EQ(buf.size(), 517);

  auto err = std::error_code();
  EXPECT_FALSE(decode_data(buf, err));
  EXPECT_EQ(err, INVALID_OPCODE);
}

TEST(TftpDataTest, RejectsOtherOpcodes)
{
  for (unsigned opc : {0U, 1U, 2U, 4U, 5U, 6U, 0x0300U})
  {
    const auto buf = bytes({opc >> 8, opc & 0xFF, 0x00, 0x01, 0x41});

    auto err = std::error_code();
    EXPECT_FALSE(decode_data(buf, err));
    EXPECT_EQ(err, INVALID_OPCODE) << opc;
  }
}

// =============================================================================
// ACK
// =============================================================================
TEST(TftpAckTest, EncodeAck)
{
  EXPECT_EQ(encode(messages::ack{5}), bytes({0x00, 0x04, 0x00, 0x05}));
  EXPECT_EQ(encode(messages::ack{0}), bytes({0x00, 0x04, 0x00, 0x00}));
  EXPECT_EQ(encode(messages::ack{0xFFFF}), bytes({0x00, 0x04, 0xFF, 0xFF}));
}

TEST(TftpAckTest, DecodeAck)
{
  auto err = std::error_code();
  auto ack = decode_ack(bytes({0x00, 0x04, 0x00, 0x05}), err);

  ASSERT_TRUE(ack) << err.message();
  EXPECT_EQ(ack->block_num, 5);
}

TEST(TftpAckTest, RejectsTrailingByte)
{
  auto err = std::error_code();

  EXPECT_FALSE(decode_ack(bytes({0x00, 0x04, 0x00, 0x05, 0xFF}), err));
  EXPECT_EQ(err, TOO_LONG);
}

TEST(TftpAckTest, RejectsShortBuffers)
{
  for (const auto &buf :
       {bytes({}), bytes({0x00}), bytes({0x00, 0x04}), bytes({0x00, 0x04, 0x00})})
  {
    auto err = std::error_code();
    EXPECT_FALSE(decode_ack(buf, err));
    EXPECT_EQ(err, TOO_SHORT) << buf.size();
  }
}

TEST(TftpAckTest, RejectsLongDataBlock)
{
  // The opcode is checked before the maximum length.
  auto err = std::error_code();

  EXPECT_FALSE(decode_ack(bytes({0x00, 0x03, 0x00, 0x01, 0xAA}), err));
  EXPECT_EQ(err, INVALID_OPCODE);
}

TEST(TftpAckTest, RejectsDataBlock)
{
  // A DATA header has the right length for an ACK but the wrong opcode.
  auto err = std::error_code();

  EXPECT_FALSE(decode_ack(bytes({0x00, 0x03, 0x00, 0x01}), err));
  EXPECT_EQ(err, INVALID_OPCODE);
}

TEST(TftpAckTest, OnlyAckOpcodeDecodes)
{
  for (unsigned opc = 0; opc <= 0xFFFF; ++opc)
  {
    const auto buf = bytes({opc >> 8, opc & 0xFF, 0x12, 0x34});

    auto err = std::error_code();
    auto ack = decode_ack(buf, err);
    if (opc == messages::ACK)
    {
      ASSERT_TRUE(ack);
      EXPECT_EQ(ack->block_num, 0x1234);
    }
    else
    {
      ASSERT_FALSE(ack) << opc;
      ASSERT_EQ(err, INVALID_OPCODE) << opc;
    }
  }
}
// NOLINTEND
