/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "incentive/incentive_config.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace decai::incentive {

  /// Everything the engine needs to decide on a refund
  struct RefundRequest {
    primitives::Address claimant;
    primitives::Timestamp submission_time = 0;
    primitives::Timestamp current_time = 0;
    primitives::Amount claimable_amount;
    bool already_claimed = false;
    primitives::Label prediction = 0;
    primitives::Label label = 0;
  };

  /// Everything the engine needs to decide on a report
  struct ReportRequest {
    primitives::Address reporter;
    primitives::Timestamp submission_time = 0;
    primitives::Timestamp current_time = 0;
    primitives::Address original_author;
    primitives::Amount initial_deposit;
    primitives::Amount claimable_amount;
    bool already_claimed_by_reporter = false;
    primitives::Label prediction = 0;
    primitives::Label label = 0;
  };

  /**
   * Prices submissions and adjudicates refund and report claims. Holds no
   * contribution records; callers pass the ledger values in and apply the
   * returned amounts to the ledger before any value moves.
   */
  class IncentiveEngine {
   public:
    virtual ~IncentiveEngine() = default;

    /// Price of a submission made at `current_time`
    virtual outcome::result<primitives::Amount> quoteCost(
        primitives::Timestamp current_time) const = 0;

    /**
     * Charges a submission: fails if `paid` is below the quote, otherwise
     * moves the pricing clock to `current_time`
     * @return the charged cost, the caller returns the excess
     */
    virtual outcome::result<primitives::Amount> chargeForSubmission(
        const primitives::Address &caller,
        const primitives::Amount &paid,
        primitives::Timestamp current_time) = 0;

    /// @return amount to return to the claimant
    virtual outcome::result<primitives::Amount> adjudicateRefund(
        const primitives::Address &caller, const RefundRequest &request) = 0;

    /// @return amount to pay to the reporter, never above claimable
    virtual outcome::result<primitives::Amount> adjudicateReport(
        const primitives::Address &caller, const ReportRequest &request) = 0;

    virtual uint64_t numValid(const primitives::Address &address) const = 0;
    virtual uint64_t totalGoodDataCount() const = 0;
    virtual uint64_t totalSubmitted() const = 0;
    virtual primitives::Timestamp lastUpdateTime() const = 0;

    /// Calls presenting an earlier time fail with ClockRegression
    virtual primitives::Timestamp lastSeenTime() const = 0;

    virtual const IncentiveConfig &config() const = 0;

    virtual primitives::Address owner() const = 0;

    virtual outcome::result<void> transferOwnership(
        const primitives::Address &caller,
        const primitives::Address &new_owner) = 0;
  };

}  // namespace decai::incentive
