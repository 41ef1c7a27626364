/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/int_serialization.hpp"

#include <gtest/gtest.h>

using namespace decai::common;

/**
 * @given a 64-bit number
 * @when serialized big-endian
 * @then the most significant byte comes first and it reads back
 */
TEST(IntSerializationTest, Uint64BigEndian) {
  auto bytes = uint64_to_be_bytes(0x0102030405060708ull);
  std::array<uint8_t, 8> expected{1, 2, 3, 4, 5, 6, 7, 8};
  EXPECT_EQ(bytes, expected);
  EXPECT_EQ(be_bytes_to_uint64(bytes), 0x0102030405060708ull);
}

/**
 * @given a small 256-bit number
 * @when serialized to a 32-byte word
 * @then it is right-aligned with leading zeros
 */
TEST(IntSerializationTest, Uint256Word) {
  auto bytes = uint256_to_be_bytes(uint256_t{0x0a0b});
  for (size_t i = 0; i < 30; ++i) {
    EXPECT_EQ(bytes[i], 0) << i;
  }
  EXPECT_EQ(bytes[30], 0x0a);
  EXPECT_EQ(bytes[31], 0x0b);
  EXPECT_EQ(be_bytes_to_uint256(bytes), uint256_t{0x0a0b});
}

/**
 * @given negative and positive signed numbers
 * @when serialized to 32-byte words
 * @then negatives are sign-extended with 0xff
 */
TEST(IntSerializationTest, SignedWord) {
  auto minus_one = int64_to_be_word(-1);
  for (auto byte : minus_one) {
    EXPECT_EQ(byte, 0xff);
  }

  auto minus_two = int64_to_be_word(-2);
  EXPECT_EQ(minus_two[0], 0xff);
  EXPECT_EQ(minus_two[31], 0xfe);

  auto five = int64_to_be_word(5);
  EXPECT_EQ(five[0], 0);
  EXPECT_EQ(five[31], 5);
}
