/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <unordered_set>

#include "primitives/common.hpp"

namespace decai::ledger {

  /**
   * Escrow bookkeeping of one submitted sample. The sample itself is not
   * kept, only its commitment (the ledger key).
   */
  struct Contribution {
    primitives::Label label = 0;
    primitives::Timestamp time = 0;
    primitives::Address sender;
    primitives::Amount initial_deposit;
    /// 0 <= claimable_amount <= initial_deposit, never increases
    primitives::Amount claimable_amount;
    uint64_t num_claims = 0;
    std::unordered_set<primitives::Address> claimed_by;

    bool isLive() const {
      return sender != primitives::Address{} and claimable_amount > 0;
    }
  };

  /// Values read by claimRefund before it drains the record
  struct RefundClaim {
    primitives::Amount claimable_amount;
    bool claimed_by_claimant = false;
    uint64_t num_claims = 0;
  };

  /// Values read by claimReport; the balance is debited separately
  struct ReportClaim {
    primitives::Amount initial_deposit;
    primitives::Amount claimable_amount;
    bool claimed_by_claimant = false;
    uint64_t num_claims = 0;
    primitives::ContributionKey key;
  };

}  // namespace decai::ledger
