/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "incentive/incentive_error.hpp"
#include "primitives/common.hpp"

namespace decai::incentive {

  constexpr primitives::Timestamp kSecondsPerDay = 24 * 60 * 60;

  /**
   * Staking parameters. Wait times are measured from the submission time of
   * a contribution.
   */
  struct IncentiveConfig {
    /// Scales the submission fee; zero makes submissions free
    primitives::Amount cost_weight{1'000'000'000'000'000ull};

    /// Submitter may reclaim the deposit from this point on
    primitives::Timestamp refund_wait_time = 1 * kSecondsPerDay;

    /// Owner may take whatever is left from this point on
    primitives::Timestamp owner_claim_wait_time = 9 * kSecondsPerDay;

    /// Anyone may take whatever is left from this point on
    primitives::Timestamp any_address_claim_wait_time = 9 * kSecondsPerDay;

    /// Initial value of the last-update time used for pricing
    primitives::Timestamp start_time = 0;

    bool operator==(const IncentiveConfig &) const = default;
  };

  inline outcome::result<void> validate(const IncentiveConfig &config) {
    if (config.refund_wait_time > config.owner_claim_wait_time
        or config.owner_claim_wait_time > config.any_address_claim_wait_time) {
      return IncentiveError::InvalidConfig;
    }
    return outcome::success();
  }

}  // namespace decai::incentive
