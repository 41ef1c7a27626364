/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/int_serialization.hpp"

#include <iterator>
#include <vector>

#include <boost/assert.hpp>

namespace decai::common {

  std::array<uint8_t, 8> uint64_to_be_bytes(uint64_t number) {
    std::array<uint8_t, 8> result{};
    for (auto it = result.rbegin(); it != result.rend(); ++it) {
      *it = static_cast<uint8_t>(number & 0xff);
      number >>= 8;
    }
    return result;
  }

  uint64_t be_bytes_to_uint64(std::span<const uint8_t> bytes) {
    BOOST_ASSERT(bytes.size() >= 8);
    uint64_t number = 0;
    for (size_t i = 0; i < 8; ++i) {
      number = (number << 8) | bytes[i];
    }
    return number;
  }

  std::array<uint8_t, 32> uint256_to_be_bytes(const uint256_t &i) {
    std::array<uint8_t, 32> res{};
    res.fill(0);
    // export_bits writes only significant bytes, most significant first
    std::vector<uint8_t> significant;
    export_bits(i, std::back_inserter(significant), 8, true);
    std::copy(significant.begin(),
              significant.end(),
              res.end() - static_cast<std::ptrdiff_t>(significant.size()));
    return res;
  }

  uint256_t be_bytes_to_uint256(std::span<const uint8_t> bytes) {
    BOOST_ASSERT(bytes.size() >= 32);
    uint256_t result;
    import_bits(result, bytes.begin(), bytes.begin() + 32, 8, true);
    return result;
  }

  std::array<uint8_t, 32> int64_to_be_word(int64_t number) {
    std::array<uint8_t, 32> res{};
    res.fill(number < 0 ? 0xff : 0x00);
    auto low = uint64_to_be_bytes(static_cast<uint64_t>(number));
    std::copy(low.begin(), low.end(), res.end() - low.size());
    return res;
  }

}  // namespace decai::common
