/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <span>

#include <boost/multiprecision/cpp_int.hpp>

namespace decai::common {

  using uint256_t = boost::multiprecision::uint256_t;

  std::array<uint8_t, 8> uint64_to_be_bytes(uint64_t number);
  uint64_t be_bytes_to_uint64(std::span<const uint8_t> bytes);

  std::array<uint8_t, 32> uint256_to_be_bytes(const uint256_t &i);
  uint256_t be_bytes_to_uint256(std::span<const uint8_t> bytes);

  /// 32-byte big-endian two's complement word, sign-extended
  std::array<uint8_t, 32> int64_to_be_word(int64_t number);

}  // namespace decai::common
