/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "ledger/contribution.hpp"
#include "outcome/outcome.hpp"

namespace decai::ledger {

  /**
   * Keyed store of contribution escrow records. Mutating methods take the
   * caller identity and accept only the owner (the orchestrator). Lookups
   * take the whole identifying tuple and fail with Mismatch if the record
   * found by key does not carry the same label, time and submitter.
   */
  class Ledger {
   public:
    virtual ~Ledger() = default;

    /**
     * Creates a record with claimable = initial = deposit
     * @return KeyCollision if a live record already exists under key
     */
    virtual outcome::result<void> record(const primitives::Address &caller,
                                         const primitives::ContributionKey &key,
                                         primitives::Label label,
                                         primitives::Timestamp time,
                                         const primitives::Address &submitter,
                                         const primitives::Amount &deposit) = 0;

    virtual outcome::result<primitives::Amount> getClaimableAmount(
        const primitives::ContributionKey &key,
        primitives::Label label,
        primitives::Timestamp time,
        const primitives::Address &submitter) const = 0;

    virtual outcome::result<primitives::Amount> getInitialDeposit(
        const primitives::ContributionKey &key,
        primitives::Label label,
        primitives::Timestamp time,
        const primitives::Address &submitter) const = 0;

    virtual outcome::result<uint64_t> getNumClaims(
        const primitives::ContributionKey &key,
        primitives::Label label,
        primitives::Timestamp time,
        const primitives::Address &submitter) const = 0;

    virtual outcome::result<bool> hasClaimed(
        const primitives::ContributionKey &key,
        primitives::Label label,
        primitives::Timestamp time,
        const primitives::Address &submitter,
        const primitives::Address &claimant) const = 0;

    /**
     * Drains the whole claimable amount and marks the claimant
     * @return values as they were before the call
     */
    virtual outcome::result<RefundClaim> claimRefund(
        const primitives::Address &caller,
        const primitives::ContributionKey &key,
        const primitives::Address &claimant) = 0;

    /**
     * Marks the claimant without touching the balance
     * @return values as they were before the call
     */
    virtual outcome::result<ReportClaim> claimReport(
        const primitives::Address &caller,
        const primitives::ContributionKey &key,
        const primitives::Address &claimant) = 0;

    /// Checked subtraction from the claimable amount
    virtual outcome::result<void> debit(const primitives::Address &caller,
                                        const primitives::ContributionKey &key,
                                        const primitives::Amount &amount) = 0;

    virtual primitives::Address owner() const = 0;

    virtual outcome::result<void> transferOwnership(
        const primitives::Address &caller,
        const primitives::Address &new_owner) = 0;

    /// Number of keys holding a record, drained ones included
    virtual size_t size() const = 0;
  };

}  // namespace decai::ledger
