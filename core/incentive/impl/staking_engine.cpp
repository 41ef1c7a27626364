/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "incentive/impl/staking_engine.hpp"

#include <boost/assert.hpp>

#include "primitives/math.hpp"

namespace decai::incentive {

  namespace {
    outcome::result<primitives::Timestamp> elapsedSince(
        primitives::Timestamp since, primitives::Timestamp now) {
      if (now < since) {
        return IncentiveError::ClockRegression;
      }
      return now - since;
    }

    outcome::result<void> checkClock(primitives::Timestamp last_seen,
                                     primitives::Timestamp now) {
      if (now < last_seen) {
        return IncentiveError::ClockRegression;
      }
      return outcome::success();
    }
  }  // namespace

  outcome::result<std::unique_ptr<StakingEngine>> StakingEngine::create(
      primitives::Address owner,
      const IncentiveConfig &config,
      std::shared_ptr<CostPolicy> cost_policy) {
    OUTCOME_TRY(validate(config));
    return std::make_unique<StakingEngine>(
        Private{}, owner, config, std::move(cost_policy));
  }

  StakingEngine::StakingEngine(Private,
                               primitives::Address owner,
                               const IncentiveConfig &config,
                               std::shared_ptr<CostPolicy> cost_policy)
      : config_(config),
        cost_policy_(std::move(cost_policy)),
        gate_(owner, "incentive"),
        state_(State{.last_update_time = config.start_time,
                     .last_seen_time = config.start_time}),
        log_(log::createLogger("StakingEngine", "incentive")) {
    BOOST_ASSERT(cost_policy_ != nullptr);
  }

  outcome::result<primitives::Amount> StakingEngine::quote(
      const State &state, primitives::Timestamp current_time) const {
    OUTCOME_TRY(checkClock(state.last_seen_time, current_time));
    if (config_.cost_weight == 0) {
      return primitives::Amount{0};
    }
    OUTCOME_TRY(elapsed, elapsedSince(state.last_update_time, current_time));
    return cost_policy_->cost(config_.cost_weight, elapsed);
  }

  outcome::result<primitives::Amount> StakingEngine::quoteCost(
      primitives::Timestamp current_time) const {
    return state_.sharedAccess(
        [&](const State &state) { return quote(state, current_time); });
  }

  outcome::result<primitives::Amount> StakingEngine::chargeForSubmission(
      const primitives::Address &caller,
      const primitives::Amount &paid,
      primitives::Timestamp current_time) {
    return state_.exclusiveAccess(
        [&](State &state) -> outcome::result<primitives::Amount> {
          OUTCOME_TRY(gate_.require(caller));
          OUTCOME_TRY(cost, quote(state, current_time));
          if (paid < cost) {
            SL_VERBOSE(log_, "Paid {} is below the cost {}", paid, cost);
            return IncentiveError::InsufficientPayment;
          }
          state.last_update_time = current_time;
          state.last_seen_time = current_time;
          ++state.total_submitted;
          SL_DEBUG(log_,
                   "Charged {} at {}, submission #{}",
                   cost,
                   current_time,
                   state.total_submitted);
          return cost;
        });
  }

  outcome::result<primitives::Amount> StakingEngine::adjudicateRefund(
      const primitives::Address &caller, const RefundRequest &request) {
    return state_.exclusiveAccess(
        [&](State &state) -> outcome::result<primitives::Amount> {
          OUTCOME_TRY(gate_.require(caller));
          OUTCOME_TRY(checkClock(state.last_seen_time, request.current_time));
          if (request.already_claimed) {
            return IncentiveError::AlreadyClaimed;
          }
          if (request.claimable_amount == 0) {
            return IncentiveError::NothingToClaim;
          }
          OUTCOME_TRY(
              elapsed,
              elapsedSince(request.submission_time, request.current_time));
          if (elapsed < config_.refund_wait_time) {
            return IncentiveError::TooEarly;
          }
          if (request.prediction != request.label) {
            return IncentiveError::ModelDisagrees;
          }

          ++state.num_valid[request.claimant];
          ++state.total_good_data_count;
          state.last_seen_time = request.current_time;
          SL_DEBUG(log_,
                   "Refund of {} to {} accepted, {} good contributions",
                   request.claimable_amount,
                   request.claimant,
                   state.num_valid[request.claimant]);
          return request.claimable_amount;
        });
  }

  outcome::result<primitives::Amount> StakingEngine::meritReward(
      const State &state, const ReportRequest &request) const {
    if (request.reporter == request.original_author) {
      return IncentiveError::SelfReport;
    }
    if (request.already_claimed_by_reporter) {
      return IncentiveError::AlreadyClaimed;
    }
    OUTCOME_TRY(elapsed,
                elapsedSince(request.submission_time, request.current_time));
    if (elapsed < config_.refund_wait_time) {
      return IncentiveError::TooEarly;
    }
    if (request.prediction == request.label) {
      return IncentiveError::ModelAgrees;
    }
    auto it = state.num_valid.find(request.reporter);
    if (it == state.num_valid.end() or it->second == 0) {
      return IncentiveError::NoStanding;
    }

    OUTCOME_TRY(weighted,
                math::checkedMul(request.initial_deposit,
                                 primitives::Amount{it->second}));
    OUTCOME_TRY(
        reward,
        math::checkedDiv(weighted,
                         primitives::Amount{state.total_good_data_count}));
    if (reward == 0 or reward > request.claimable_amount) {
      SL_DEBUG(log_,
               "Merit reward {} clamped to claimable {}",
               reward,
               request.claimable_amount);
      reward = request.claimable_amount;
    }
    return reward;
  }

  outcome::result<primitives::Amount> StakingEngine::adjudicateReport(
      const primitives::Address &caller, const ReportRequest &request) {
    return state_.exclusiveAccess(
        [&](State &state) -> outcome::result<primitives::Amount> {
          OUTCOME_TRY(gate_.require(caller));
          OUTCOME_TRY(checkClock(state.last_seen_time, request.current_time));
          if (request.claimable_amount == 0) {
            return IncentiveError::NothingToClaim;
          }
          OUTCOME_TRY(
              elapsed,
              elapsedSince(request.submission_time, request.current_time));

          if (elapsed >= config_.owner_claim_wait_time
              and request.reporter == gate_.owner()) {
            SL_DEBUG(log_,
                     "Owner sweep of {} by {}",
                     request.claimable_amount,
                     request.reporter);
            state.last_seen_time = request.current_time;
            return request.claimable_amount;
          }
          if (elapsed >= config_.any_address_claim_wait_time) {
            SL_DEBUG(log_,
                     "Open sweep of {} by {}",
                     request.claimable_amount,
                     request.reporter);
            state.last_seen_time = request.current_time;
            return request.claimable_amount;
          }

          auto reward = meritReward(state, request);
          if (reward.has_error()) {
            SL_VERBOSE(log_,
                       "Report by {} rejected: {}",
                       request.reporter,
                       reward.error().message());
            return reward.error();
          }
          SL_DEBUG(log_,
                   "Merit report by {} rewarded with {}",
                   request.reporter,
                   reward.value());
          state.last_seen_time = request.current_time;
          return reward;
        });
  }

  uint64_t StakingEngine::numValid(const primitives::Address &address) const {
    return state_.sharedAccess([&](const State &state) -> uint64_t {
      auto it = state.num_valid.find(address);
      return it == state.num_valid.end() ? 0 : it->second;
    });
  }

  uint64_t StakingEngine::totalGoodDataCount() const {
    return state_.sharedAccess(
        [](const State &state) { return state.total_good_data_count; });
  }

  uint64_t StakingEngine::totalSubmitted() const {
    return state_.sharedAccess(
        [](const State &state) { return state.total_submitted; });
  }

  primitives::Timestamp StakingEngine::lastUpdateTime() const {
    return state_.sharedAccess(
        [](const State &state) { return state.last_update_time; });
  }

  primitives::Timestamp StakingEngine::lastSeenTime() const {
    return state_.sharedAccess(
        [](const State &state) { return state.last_seen_time; });
  }

  const IncentiveConfig &StakingEngine::config() const {
    return config_;
  }

  primitives::Address StakingEngine::owner() const {
    return gate_.owner();
  }

  outcome::result<void> StakingEngine::transferOwnership(
      const primitives::Address &caller, const primitives::Address &new_owner) {
    // under the state lock, so no adjudication straddles a handover
    return state_.exclusiveAccess(
        [&](State &) { return gate_.transfer(caller, new_owner); });
  }

}  // namespace decai::incentive
