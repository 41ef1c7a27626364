/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "replay/scenario.hpp"

#include <gtest/gtest.h>

#include "common/blob.hpp"
#include "primitives/parsing.hpp"
#include "testutil/outcome.hpp"
#include "testutil/primitives/address.hpp"

using decai::primitives::ParseError;
using decai::replay::AddStep;
using decai::replay::parseScenario;
using decai::replay::RefundStep;
using decai::replay::ReportStep;
using decai::replay::Sample;
using decai::replay::ScenarioError;
using decai::replay::TrainStep;
using testutil::makeAddress;

/**
 * @given a scenario with a model and one step of each kind
 * @when parsed
 * @then every field lands in its step
 */
TEST(ScenarioTest, ParsesAllSteps) {
  EXPECT_OUTCOME_TRUE(scenario, parseScenario(R"({
    "model": [{"sample": [1, -2], "label": 1}],
    "steps": [
      {"op": "add", "sender": "0x0000000000000000000000000000000000000001",
       "sample": [1, -2], "label": 1, "paid": "115792089237316195423570985008687907853269984665640564039457584007913129639935", "time": 10},
      {"op": "refund", "submitter": "0x0000000000000000000000000000000000000001",
       "sample": [1, -2], "label": 1, "added_time": 10, "time": 100},
      {"op": "report", "reporter": "0x0000000000000000000000000000000000000002",
       "author": "0x0000000000000000000000000000000000000001",
       "sample": [3], "label": 0, "added_time": 20, "time": 200},
      {"op": "train", "sample": [3], "label": 5}
    ]
  })"));

  ASSERT_EQ(scenario.model.size(), 1);
  EXPECT_EQ(scenario.model[0].sample, (Sample{1, -2}));
  EXPECT_EQ(scenario.model[0].label, 1);

  ASSERT_EQ(scenario.steps.size(), 4);

  const auto &add = std::get<AddStep>(scenario.steps[0]);
  EXPECT_EQ(add.sender, makeAddress(1));
  EXPECT_EQ(add.paid, std::numeric_limits<decai::primitives::Amount>::max());
  EXPECT_EQ(add.time, 10);

  const auto &refund = std::get<RefundStep>(scenario.steps[1]);
  EXPECT_EQ(refund.submitter, makeAddress(1));
  EXPECT_EQ(refund.added_time, 10);
  EXPECT_EQ(refund.time, 100);

  const auto &report = std::get<ReportStep>(scenario.steps[2]);
  EXPECT_EQ(report.reporter, makeAddress(2));
  EXPECT_EQ(report.original_author, makeAddress(1));
  EXPECT_EQ(report.sample, (Sample{3}));
  EXPECT_EQ(report.label, 0);

  const auto &train = std::get<TrainStep>(scenario.steps[3]);
  EXPECT_EQ(train.label, 5);
}

/**
 * @given a plain number as the paid amount
 * @when parsed
 * @then it is accepted like its decimal string
 */
TEST(ScenarioTest, NumericAmount) {
  EXPECT_OUTCOME_TRUE(scenario, parseScenario(R"({"steps": [
      {"op": "add", "sender": "0x0000000000000000000000000000000000000001",
       "sample": [], "label": 0, "paid": 360, "time": 0}]})"));
  ASSERT_EQ(scenario.steps.size(), 1);
  EXPECT_EQ(std::get<AddStep>(scenario.steps[0]).paid, 360);
  EXPECT_TRUE(scenario.model.empty());
}

/**
 * @given broken documents
 * @when parsed
 * @then the matching error is returned
 */
TEST(ScenarioTest, Errors) {
  EXPECT_EC(parseScenario("{"), ScenarioError::MALFORMED_JSON);
  EXPECT_EC(parseScenario("[]"), ScenarioError::MALFORMED_JSON);
  EXPECT_EC(parseScenario("{}"), ScenarioError::MISSING_FIELD);
  EXPECT_EC(parseScenario(R"({"steps": [{"op": "mint", "sample": [], "label": 0}]})"),
            ScenarioError::UNKNOWN_OP);
  EXPECT_EC(parseScenario(R"({"steps": [{"op": "train", "sample": [1.5], "label": 0}]})"),
            ScenarioError::MISSING_FIELD);
  EXPECT_EC(parseScenario(R"({"steps": [{"op": "refund", "submitter": "0x01",
      "sample": [], "label": 0, "added_time": 0, "time": 1}]})"),
            decai::common::BlobError::INCORRECT_LENGTH);
  EXPECT_EC(parseScenario(R"({"steps": [{"op": "add", "sender": "0x0000000000000000000000000000000000000001",
      "sample": [], "label": 0, "paid": "12x", "time": 1}]})"),
            ParseError::NON_DIGIT_INPUT);
  EXPECT_EC(decai::replay::loadScenario("/nonexistent/scenario.json"),
            ScenarioError::FILE_NOT_FOUND);
}
