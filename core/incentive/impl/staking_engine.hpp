/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "incentive/incentive_engine.hpp"

#include <memory>
#include <unordered_map>

#include "access/owner_gate.hpp"
#include "incentive/cost_policy.hpp"
#include "log/logger.hpp"
#include "utils/safe_object.hpp"

namespace decai::incentive {

  /**
   * Deposit-based incentive mechanism. A submitter stakes the quoted cost;
   * the stake comes back once the model agrees with the sample, or goes to
   * a reporter who shows the model disagrees. Unclaimed stakes are swept by
   * the owner, and later by anyone.
   */
  class StakingEngine final : public IncentiveEngine {
   private:
    struct Private {
      explicit Private() = default;
    };

   public:
    /// Reachable through create() only
    StakingEngine(Private,
                  primitives::Address owner,
                  const IncentiveConfig &config,
                  std::shared_ptr<CostPolicy> cost_policy);

    /// @return InvalidConfig unless refund <= owner claim <= any claim wait
    static outcome::result<std::unique_ptr<StakingEngine>> create(
        primitives::Address owner,
        const IncentiveConfig &config,
        std::shared_ptr<CostPolicy> cost_policy);

    outcome::result<primitives::Amount> quoteCost(
        primitives::Timestamp current_time) const override;

    outcome::result<primitives::Amount> chargeForSubmission(
        const primitives::Address &caller,
        const primitives::Amount &paid,
        primitives::Timestamp current_time) override;

    outcome::result<primitives::Amount> adjudicateRefund(
        const primitives::Address &caller,
        const RefundRequest &request) override;

    outcome::result<primitives::Amount> adjudicateReport(
        const primitives::Address &caller,
        const ReportRequest &request) override;

    uint64_t numValid(const primitives::Address &address) const override;
    uint64_t totalGoodDataCount() const override;
    uint64_t totalSubmitted() const override;
    primitives::Timestamp lastUpdateTime() const override;
    primitives::Timestamp lastSeenTime() const override;
    const IncentiveConfig &config() const override;

    primitives::Address owner() const override;

    outcome::result<void> transferOwnership(
        const primitives::Address &caller,
        const primitives::Address &new_owner) override;

   private:
    struct State {
      /// Time of the last charged submission, the origin of pricing
      primitives::Timestamp last_update_time = 0;
      /// Latest time presented by any accepted call
      primitives::Timestamp last_seen_time = 0;
      uint64_t total_submitted = 0;
      uint64_t total_good_data_count = 0;
      std::unordered_map<primitives::Address, uint64_t> num_valid;
    };

    outcome::result<primitives::Amount> quote(
        const State &state, primitives::Timestamp current_time) const;

    outcome::result<primitives::Amount> meritReward(
        const State &state, const ReportRequest &request) const;

    const IncentiveConfig config_;
    std::shared_ptr<CostPolicy> cost_policy_;
    access::OwnerGate gate_;
    SafeObject<State> state_;
    log::Logger log_;
  };

}  // namespace decai::incentive
