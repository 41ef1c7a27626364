/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "incentive/impl/staking_engine.hpp"

#include <gtest/gtest.h>

#include "incentive/impl/sqrt_decay_cost_policy.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/primitives/address.hpp"

using decai::access::AccessError;
using decai::incentive::IncentiveConfig;
using decai::incentive::IncentiveError;
using decai::incentive::RefundRequest;
using decai::incentive::ReportRequest;
using decai::incentive::SqrtDecayCostPolicy;
using decai::incentive::StakingEngine;
using decai::primitives::Address;
using decai::primitives::Amount;
using testutil::makeAddress;

class StakingEngineTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    config.cost_weight = Amount{1'000'000'000'000'000ull};
    config.refund_wait_time = 50;
    config.owner_claim_wait_time = 100;
    config.any_address_claim_wait_time = 200;
    config.start_time = 0;
    makeEngine();
  }

  void makeEngine() {
    auto res = StakingEngine::create(
        trainer, config, std::make_shared<SqrtDecayCostPolicy>());
    ASSERT_TRUE(res.has_value()) << res.error().message();
    engine = std::move(res.value());
  }

  RefundRequest refundRequest(const Address &claimant) const {
    return RefundRequest{
        .claimant = claimant,
        .submission_time = 0,
        .current_time = 60,
        .claimable_amount = Amount{10},
        .already_claimed = false,
        .prediction = 1,
        .label = 1,
    };
  }

  /// a report the model disputes, made 120 seconds after submission
  ReportRequest reportRequest(const Address &reporter) const {
    return ReportRequest{
        .reporter = reporter,
        .submission_time = 0,
        .current_time = 120,
        .original_author = author,
        .initial_deposit = Amount{1000},
        .claimable_amount = Amount{1000},
        .already_claimed_by_reporter = false,
        .prediction = 0,
        .label = 1,
    };
  }

  /// gives `address` a number of accepted refunds
  void earnStanding(const Address &address, size_t count) {
    for (size_t i = 0; i < count; ++i) {
      EXPECT_OUTCOME_TRUE_1(
          engine->adjudicateRefund(trainer, refundRequest(address)));
    }
  }

  const Address trainer = makeAddress(0xee);
  const Address author = makeAddress(1);
  const Address reporter = makeAddress(2);
  const Address bystander = makeAddress(3);
  IncentiveConfig config;
  std::unique_ptr<StakingEngine> engine;
};

/**
 * @given wait times that are out of order
 * @when an engine is created
 * @then InvalidConfig is returned
 */
TEST_F(StakingEngineTest, RejectsUnorderedWaits) {
  config.owner_claim_wait_time = 300;
  EXPECT_EC(StakingEngine::create(
                trainer, config, std::make_shared<SqrtDecayCostPolicy>()),
            IncentiveError::InvalidConfig);
  config.owner_claim_wait_time = 40;
  EXPECT_EC(StakingEngine::create(
                trainer, config, std::make_shared<SqrtDecayCostPolicy>()),
            IncentiveError::InvalidConfig);
}

/**
 * @given a fresh engine
 * @when the cost is quoted with no time passed and later
 * @then it starts at weight * 3600 and decays with sqrt of elapsed time
 */
TEST_F(StakingEngineTest, QuoteDecays) {
  EXPECT_OUTCOME_TRUE(at_start, engine->quoteCost(0));
  EXPECT_EQ(at_start, Amount{config.cost_weight * 3600});
  EXPECT_OUTCOME_TRUE(later, engine->quoteCost(100));
  EXPECT_EQ(later, Amount{config.cost_weight * 360});
  EXPECT_LE(later, at_start);
}

/**
 * @given an engine whose last update is at 10
 * @when the cost is quoted for 5
 * @then ClockRegression is returned, unless submissions are free
 */
TEST_F(StakingEngineTest, QuoteClockRegression) {
  config.start_time = 10;
  makeEngine();
  EXPECT_EC(engine->quoteCost(5), IncentiveError::ClockRegression);

  config.cost_weight = 0;
  makeEngine();
  EXPECT_OUTCOME_TRUE(cost, engine->quoteCost(5));
  EXPECT_EQ(cost, 0);
}

/**
 * @given a quoted cost
 * @when the trainer is charged less, then at least that
 * @then underpayment fails, payment updates pricing time and counters
 */
TEST_F(StakingEngineTest, ChargeForSubmission) {
  EXPECT_OUTCOME_TRUE(cost, engine->quoteCost(400));
  EXPECT_EC(engine->chargeForSubmission(trainer, Amount{cost - 1}, 400),
            IncentiveError::InsufficientPayment);
  EXPECT_EQ(engine->totalSubmitted(), 0);
  EXPECT_EQ(engine->lastUpdateTime(), 0);

  EXPECT_OUTCOME_TRUE(charged, engine->chargeForSubmission(trainer, cost, 400));
  EXPECT_EQ(charged, cost);
  EXPECT_EQ(engine->totalSubmitted(), 1);
  EXPECT_EQ(engine->lastUpdateTime(), 400);

  EXPECT_EC(engine->chargeForSubmission(trainer, cost, 399),
            IncentiveError::ClockRegression);
}

/**
 * @given an engine created with a start time of 10
 * @when its clocks are read
 * @then both pricing and the monotonic clock start there
 */
TEST_F(StakingEngineTest, ClockStartsAtStartTime) {
  config.start_time = 10;
  makeEngine();
  EXPECT_EQ(engine->lastUpdateTime(), 10);
  EXPECT_EQ(engine->lastSeenTime(), 10);
}

/**
 * @given a submission charged at 200
 * @when a refund and a report present 150
 * @then both fail with ClockRegression and the clock stays at 200
 */
TEST_F(StakingEngineTest, ClaimsCannotPresentEarlierTime) {
  EXPECT_OUTCOME_TRUE(cost, engine->quoteCost(200));
  EXPECT_OUTCOME_TRUE_1(engine->chargeForSubmission(trainer, cost, 200));
  EXPECT_EQ(engine->lastSeenTime(), 200);

  auto refund = refundRequest(author);
  refund.current_time = 150;
  EXPECT_EC(engine->adjudicateRefund(trainer, refund),
            IncentiveError::ClockRegression);

  auto owner_sweep = reportRequest(trainer);
  owner_sweep.current_time = 150;
  EXPECT_EC(engine->adjudicateReport(trainer, owner_sweep),
            IncentiveError::ClockRegression);

  EXPECT_EQ(engine->lastSeenTime(), 200);
  EXPECT_EQ(engine->numValid(author), 0);
}

/**
 * @given a refund accepted at 250 after a submission at 200
 * @when a submission or a report then presents 240
 * @then both fail with ClockRegression, and pricing still starts at 200
 */
TEST_F(StakingEngineTest, AcceptedClaimAdvancesClock) {
  EXPECT_OUTCOME_TRUE(cost, engine->quoteCost(200));
  EXPECT_OUTCOME_TRUE_1(engine->chargeForSubmission(trainer, cost, 200));

  auto refund = refundRequest(author);
  refund.submission_time = 200;
  refund.current_time = 250;
  EXPECT_OUTCOME_TRUE_1(engine->adjudicateRefund(trainer, refund));
  EXPECT_EQ(engine->lastSeenTime(), 250);
  EXPECT_EQ(engine->lastUpdateTime(), 200);

  EXPECT_EC(engine->quoteCost(240), IncentiveError::ClockRegression);
  EXPECT_EC(engine->chargeForSubmission(trainer, cost, 240),
            IncentiveError::ClockRegression);
  auto owner_sweep = reportRequest(trainer);
  owner_sweep.current_time = 240;
  EXPECT_EC(engine->adjudicateReport(trainer, owner_sweep),
            IncentiveError::ClockRegression);

  EXPECT_OUTCOME_TRUE_1(engine->quoteCost(250));
}

/**
 * @given a refund the model disputes at 300
 * @when it is rejected
 * @then the clock does not move and an earlier claim is still accepted
 */
TEST_F(StakingEngineTest, RejectedClaimLeavesClock) {
  auto disputed = refundRequest(author);
  disputed.current_time = 300;
  disputed.prediction = 0;
  EXPECT_EC(engine->adjudicateRefund(trainer, disputed),
            IncentiveError::ModelDisagrees);
  EXPECT_EQ(engine->lastSeenTime(), 0);

  EXPECT_OUTCOME_TRUE_1(
      engine->adjudicateRefund(trainer, refundRequest(author)));
  EXPECT_EQ(engine->lastSeenTime(), 60);
}

/**
 * @given an engine handed over from the trainer to the author
 * @when both call mutating entry points
 * @then the previous owner is rejected and the new one is served
 */
TEST_F(StakingEngineTest, TransferOwnershipHandsOverGate) {
  EXPECT_OUTCOME_TRUE_1(engine->transferOwnership(trainer, author));
  EXPECT_EQ(engine->owner(), author);

  EXPECT_EC(engine->adjudicateRefund(trainer, refundRequest(bystander)),
            AccessError::Unauthorized);
  EXPECT_EQ(engine->numValid(bystander), 0);

  EXPECT_OUTCOME_TRUE(
      amount, engine->adjudicateRefund(author, refundRequest(bystander)));
  EXPECT_EQ(amount, 10);
  EXPECT_EQ(engine->numValid(bystander), 1);
}

/**
 * @given an engine owned by the trainer
 * @when anyone else calls a mutating entry point
 * @then Unauthorized is returned
 */
TEST_F(StakingEngineTest, OnlyOwnerMutates) {
  EXPECT_EC(engine->chargeForSubmission(author, Amount{0}, 1),
            AccessError::Unauthorized);
  EXPECT_EC(engine->adjudicateRefund(author, refundRequest(author)),
            AccessError::Unauthorized);
  EXPECT_EC(engine->adjudicateReport(reporter, reportRequest(reporter)),
            AccessError::Unauthorized);
  EXPECT_EC(engine->transferOwnership(author, author),
            AccessError::Unauthorized);
  EXPECT_EQ(engine->owner(), trainer);
}

/**
 * @given a refund request past the refund wait with an agreeing model
 * @when adjudicated
 * @then the whole claimable is granted and the claimant gains standing
 */
TEST_F(StakingEngineTest, RefundAccepted) {
  EXPECT_OUTCOME_TRUE(amount,
                      engine->adjudicateRefund(trainer, refundRequest(author)));
  EXPECT_EQ(amount, 10);
  EXPECT_EQ(engine->numValid(author), 1);
  EXPECT_EQ(engine->totalGoodDataCount(), 1);
}

/**
 * @given refund requests violating one condition each
 * @when adjudicated
 * @then each is rejected with its own error and no standing is gained
 */
TEST_F(StakingEngineTest, RefundRejections) {
  auto claimed = refundRequest(author);
  claimed.already_claimed = true;
  EXPECT_EC(engine->adjudicateRefund(trainer, claimed),
            IncentiveError::AlreadyClaimed);

  auto drained = refundRequest(author);
  drained.claimable_amount = 0;
  EXPECT_EC(engine->adjudicateRefund(trainer, drained),
            IncentiveError::NothingToClaim);

  auto early = refundRequest(author);
  early.current_time = 49;
  EXPECT_EC(engine->adjudicateRefund(trainer, early), IncentiveError::TooEarly);

  auto regressed = refundRequest(author);
  regressed.submission_time = 100;
  EXPECT_EC(engine->adjudicateRefund(trainer, regressed),
            IncentiveError::ClockRegression);

  auto disputed = refundRequest(author);
  disputed.prediction = 0;
  EXPECT_EC(engine->adjudicateRefund(trainer, disputed),
            IncentiveError::ModelDisagrees);

  EXPECT_EQ(engine->numValid(author), 0);
  EXPECT_EQ(engine->totalGoodDataCount(), 0);
}

/**
 * @given waits 50/100/200 and a report at elapsed 120
 * @when the owner and a reporter without standing report
 * @then the owner sweeps everything, the reporter is rejected
 */
TEST_F(StakingEngineTest, OwnerTierBeforeMerit) {
  EXPECT_OUTCOME_TRUE(swept,
                      engine->adjudicateReport(trainer, reportRequest(trainer)));
  EXPECT_EQ(swept, 1000);

  EXPECT_EC(engine->adjudicateReport(trainer, reportRequest(reporter)),
            IncentiveError::NoStanding);
}

/**
 * @given a report at elapsed 200
 * @when a bystander without standing reports an agreeing sample
 * @then the open sweep grants the whole claimable anyway
 */
TEST_F(StakingEngineTest, AnyAddressTier) {
  auto request = reportRequest(bystander);
  request.current_time = 200;
  request.prediction = request.label;
  request.claimable_amount = 700;
  EXPECT_OUTCOME_TRUE(swept, engine->adjudicateReport(trainer, request));
  EXPECT_EQ(swept, 700);
}

/**
 * @given a reporter with 3 of 10 good contributions
 * @when it reports a disputed deposit of 1000
 * @then it is rewarded 1000 * 3 / 10
 */
TEST_F(StakingEngineTest, MeritSplit) {
  earnStanding(reporter, 3);
  earnStanding(bystander, 7);
  EXPECT_OUTCOME_TRUE(reward,
                      engine->adjudicateReport(trainer, reportRequest(reporter)));
  EXPECT_EQ(reward, 300);
}

/**
 * @given merit rewards that round to zero or exceed the claimable
 * @when reported
 * @then the reward is clamped to the claimable amount
 */
TEST_F(StakingEngineTest, MeritClamp) {
  earnStanding(reporter, 1);

  auto single = reportRequest(reporter);
  single.initial_deposit = 1;
  single.claimable_amount = 1;
  EXPECT_OUTCOME_TRUE(whole, engine->adjudicateReport(trainer, single));
  EXPECT_EQ(whole, 1);

  auto partly_paid = reportRequest(reporter);
  partly_paid.claimable_amount = 400;
  EXPECT_OUTCOME_TRUE(capped, engine->adjudicateReport(trainer, partly_paid));
  EXPECT_EQ(capped, 400);

  // standing earned after the reports above, so at their time
  auto late_refund = refundRequest(bystander);
  late_refund.current_time = 120;
  EXPECT_OUTCOME_TRUE_1(engine->adjudicateRefund(trainer, late_refund));
  EXPECT_OUTCOME_TRUE_1(engine->adjudicateRefund(trainer, late_refund));
  auto tiny = reportRequest(reporter);
  tiny.initial_deposit = 1;
  tiny.claimable_amount = 1;
  EXPECT_OUTCOME_TRUE(rounded, engine->adjudicateReport(trainer, tiny));
  EXPECT_EQ(rounded, 1);
}

/**
 * @given merit reports violating one condition each
 * @when adjudicated
 * @then each is rejected with its own error
 */
TEST_F(StakingEngineTest, MeritRejections) {
  earnStanding(reporter, 1);
  earnStanding(author, 1);

  EXPECT_EC(engine->adjudicateReport(trainer, reportRequest(author)),
            IncentiveError::SelfReport);

  auto claimed = reportRequest(reporter);
  claimed.already_claimed_by_reporter = true;
  EXPECT_EC(engine->adjudicateReport(trainer, claimed),
            IncentiveError::AlreadyClaimed);

  auto early = reportRequest(reporter);
  early.submission_time = 100;
  EXPECT_EC(engine->adjudicateReport(trainer, early), IncentiveError::TooEarly);

  auto agreeing = reportRequest(reporter);
  agreeing.prediction = agreeing.label;
  EXPECT_EC(engine->adjudicateReport(trainer, agreeing),
            IncentiveError::ModelAgrees);

  auto drained = reportRequest(reporter);
  drained.claimable_amount = 0;
  EXPECT_EC(engine->adjudicateReport(trainer, drained),
            IncentiveError::NothingToClaim);

  auto regressed = reportRequest(reporter);
  regressed.submission_time = 130;
  EXPECT_EC(engine->adjudicateReport(trainer, regressed),
            IncentiveError::ClockRegression);
}

/**
 * @given an original author with standing past the owner wait
 * @when the author, who is not the owner, reports its own sample
 * @then it is rejected as a self report
 */
TEST_F(StakingEngineTest, SelfReportAfterOwnerWait) {
  earnStanding(author, 1);
  auto request = reportRequest(author);
  request.current_time = 150;
  EXPECT_EC(engine->adjudicateReport(trainer, request),
            IncentiveError::SelfReport);
}
