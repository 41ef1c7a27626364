/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "ledger/ledger.hpp"

#include <unordered_map>

#include "access/owner_gate.hpp"
#include "log/logger.hpp"
#include "utils/safe_object.hpp"

namespace decai::ledger {

  /**
   * In-memory ledger. Every call runs inside one critical section over the
   * whole record map, so calls on the same key never interleave and a
   * committed claim is visible to the next call.
   */
  class LedgerImpl final : public Ledger {
   public:
    explicit LedgerImpl(primitives::Address owner);

    outcome::result<void> record(const primitives::Address &caller,
                                 const primitives::ContributionKey &key,
                                 primitives::Label label,
                                 primitives::Timestamp time,
                                 const primitives::Address &submitter,
                                 const primitives::Amount &deposit) override;

    outcome::result<primitives::Amount> getClaimableAmount(
        const primitives::ContributionKey &key,
        primitives::Label label,
        primitives::Timestamp time,
        const primitives::Address &submitter) const override;

    outcome::result<primitives::Amount> getInitialDeposit(
        const primitives::ContributionKey &key,
        primitives::Label label,
        primitives::Timestamp time,
        const primitives::Address &submitter) const override;

    outcome::result<uint64_t> getNumClaims(
        const primitives::ContributionKey &key,
        primitives::Label label,
        primitives::Timestamp time,
        const primitives::Address &submitter) const override;

    outcome::result<bool> hasClaimed(
        const primitives::ContributionKey &key,
        primitives::Label label,
        primitives::Timestamp time,
        const primitives::Address &submitter,
        const primitives::Address &claimant) const override;

    outcome::result<RefundClaim> claimRefund(
        const primitives::Address &caller,
        const primitives::ContributionKey &key,
        const primitives::Address &claimant) override;

    outcome::result<ReportClaim> claimReport(
        const primitives::Address &caller,
        const primitives::ContributionKey &key,
        const primitives::Address &claimant) override;

    outcome::result<void> debit(const primitives::Address &caller,
                                const primitives::ContributionKey &key,
                                const primitives::Amount &amount) override;

    primitives::Address owner() const override;

    outcome::result<void> transferOwnership(
        const primitives::Address &caller,
        const primitives::Address &new_owner) override;

    size_t size() const override;

   private:
    using Records =
        std::unordered_map<primitives::ContributionKey, Contribution>;

    /// Runs f on the record matching the whole tuple
    template <typename F>
    auto inspect(const primitives::ContributionKey &key,
                 primitives::Label label,
                 primitives::Timestamp time,
                 const primitives::Address &submitter,
                 F &&f) const
        -> outcome::result<decltype(f(std::declval<const Contribution &>()))>;

    access::OwnerGate gate_;
    SafeObject<Records> records_;
    log::Logger log_;
  };

}  // namespace decai::ledger
