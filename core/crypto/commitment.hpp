/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>
#include <ranges>
#include <vector>

#include "common/int_serialization.hpp"
#include "crypto/sha/sha256.hpp"
#include "primitives/common.hpp"

namespace decai::crypto {

  /// Sample representations accepted by the ledger: any range of signed
  /// integers, e.g. std::vector<int64_t> or std::array<int64_t, N>
  template <typename Sample>
  concept SampleRange =
      std::ranges::sized_range<const Sample>
      and std::signed_integral<std::ranges::range_value_t<const Sample>>;

  /**
   * Packed encoding of the identifying tuple of a contribution.
   * Sample elements are 32-byte big-endian two's complement words, the label
   * takes 8 bytes, the time a 32-byte word, the submitter its 20 bytes.
   */
  template <SampleRange Sample>
  std::vector<uint8_t> encodeContribution(const Sample &sample,
                                          primitives::Label label,
                                          primitives::Timestamp time,
                                          const primitives::Address &submitter) {
    std::vector<uint8_t> out;
    out.reserve(std::ranges::size(sample) * 32 + 8 + 32 + submitter.size());
    for (const auto &element : sample) {
      auto word = common::int64_to_be_word(static_cast<int64_t>(element));
      out.insert(out.end(), word.begin(), word.end());
    }
    auto label_bytes = common::uint64_to_be_bytes(label);
    out.insert(out.end(), label_bytes.begin(), label_bytes.end());
    auto time_word = common::uint256_to_be_bytes(common::uint256_t{time});
    out.insert(out.end(), time_word.begin(), time_word.end());
    out.insert(out.end(), submitter.begin(), submitter.end());
    return out;
  }

  /// Ledger key of a contribution
  template <SampleRange Sample>
  primitives::ContributionKey contributionKey(
      const Sample &sample,
      primitives::Label label,
      primitives::Timestamp time,
      const primitives::Address &submitter) {
    return primitives::ContributionKey{
        sha256(encodeContribution(sample, label, time, submitter))};
  }

}  // namespace decai::crypto
