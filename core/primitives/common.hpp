/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include "common/blob.hpp"

namespace decai::primitives {

  /// Escrowed value, 256-bit unsigned as on the settlement layer
  using Amount = boost::multiprecision::uint256_t;

  /// Seconds, always supplied by the caller
  using Timestamp = uint64_t;

  /// Classification assigned to a sample
  using Label = uint64_t;

}  // namespace decai::primitives

/// Identity of a participant or of the operator
DECAI_BLOB_STRICT_TYPEDEF(decai::primitives, Address, 20);

/// Commitment of (sample, label, time, submitter)
DECAI_BLOB_STRICT_TYPEDEF(decai::primitives, ContributionKey, 32);

template <>
struct fmt::formatter<decai::primitives::Amount>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const decai::primitives::Amount &amount,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    auto str = amount.str();
    return fmt::formatter<std::string_view>::format(str, ctx);
  }
};
