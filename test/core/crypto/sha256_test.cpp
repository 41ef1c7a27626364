/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <gtest/gtest.h>

using decai::crypto::sha256;

/**
 * @given the empty string and "abc"
 * @when hashed
 * @then the published SHA-256 digests come out
 */
TEST(Sha256Test, KnownVectors) {
  EXPECT_EQ(
      sha256("").toHex(),
      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(
      sha256("abc").toHex(),
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

/**
 * @given the same input as a string and as bytes
 * @when hashed
 * @then both overloads agree
 */
TEST(Sha256Test, StringAndBytesAgree) {
  std::vector<uint8_t> bytes{'a', 'b', 'c'};
  EXPECT_EQ(sha256("abc"), sha256(bytes));
}
