/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/parsing.hpp"

#include <gtest/gtest.h>

#include "common/hexutil.hpp"
#include "testutil/outcome.hpp"

using decai::common::BlobError;
using decai::common::UnhexError;
using decai::primitives::Amount;
using decai::primitives::amountFromString;
using decai::primitives::addressFromString;
using decai::primitives::ArithmeticError;
using decai::primitives::ParseError;

/**
 * @given decimal strings up to the 256-bit limit
 * @when parsed as amounts
 * @then the exact values come back
 */
TEST(ParsingTest, AmountFromDecimal) {
  EXPECT_OUTCOME_TRUE(zero, amountFromString("0"));
  EXPECT_EQ(zero, 0);
  EXPECT_OUTCOME_TRUE(weight, amountFromString("1000000000000000"));
  EXPECT_EQ(weight, Amount{1'000'000'000'000'000ull});
  EXPECT_OUTCOME_TRUE(
      max,
      amountFromString("1157920892373161954235709850086879078532"
                       "69984665640564039457584007913129639935"));
  EXPECT_EQ(max, std::numeric_limits<Amount>::max());
}

/**
 * @given malformed or oversized decimal strings
 * @when parsed as amounts
 * @then the matching error is returned
 */
TEST(ParsingTest, AmountRejectsBadInput) {
  EXPECT_EC(amountFromString(""), ParseError::EMPTY_INPUT);
  EXPECT_EC(amountFromString("12a"), ParseError::NON_DIGIT_INPUT);
  EXPECT_EC(amountFromString("-1"), ParseError::NON_DIGIT_INPUT);
  EXPECT_EC(
      amountFromString("1157920892373161954235709850086879078532"
                       "69984665640564039457584007913129639936"),
      ArithmeticError::Overflow);
}

/**
 * @given 0x-prefixed hex strings
 * @when parsed as addresses
 * @then only 20-byte values are accepted
 */
TEST(ParsingTest, AddressFromHex) {
  EXPECT_OUTCOME_TRUE(
      address, addressFromString("0x00000000000000000000000000000000000000a1"));
  EXPECT_EQ(address[19], 0xa1);
  EXPECT_EQ(address[0], 0);

  EXPECT_EC(addressFromString(""), ParseError::EMPTY_INPUT);
  EXPECT_EC(addressFromString("00000000000000000000000000000000000000a1"),
            UnhexError::MISSING_0X_PREFIX);
  EXPECT_EC(addressFromString("0x00a1"), BlobError::INCORRECT_LENGTH);
  EXPECT_EC(addressFromString("0x0g000000000000000000000000000000000000a1"),
            UnhexError::NON_HEX_INPUT);
}
