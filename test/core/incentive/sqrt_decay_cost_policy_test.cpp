/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "incentive/impl/sqrt_decay_cost_policy.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using decai::incentive::SqrtDecayCostPolicy;
using decai::primitives::Amount;
using decai::primitives::ArithmeticError;

/**
 * @given weight 1
 * @when the cost is quoted for several elapsed times
 * @then it is 3600 divided by the integer root of the elapsed time
 */
TEST(SqrtDecayCostPolicyTest, KnownValues) {
  SqrtDecayCostPolicy policy;
  EXPECT_OUTCOME_TRUE(at0, policy.cost(Amount{1}, 0));
  EXPECT_EQ(at0, 3600);
  EXPECT_OUTCOME_TRUE(at1, policy.cost(Amount{1}, 1));
  EXPECT_EQ(at1, 3600);
  EXPECT_OUTCOME_TRUE(at3, policy.cost(Amount{1}, 3));
  EXPECT_EQ(at3, 3600);
  EXPECT_OUTCOME_TRUE(at4, policy.cost(Amount{1}, 4));
  EXPECT_EQ(at4, 1800);
  EXPECT_OUTCOME_TRUE(at_hour, policy.cost(Amount{1}, 3600));
  EXPECT_EQ(at_hour, 60);
}

/**
 * @given a fixed weight
 * @when the elapsed time grows
 * @then the cost never increases
 */
TEST(SqrtDecayCostPolicyTest, NonIncreasing) {
  SqrtDecayCostPolicy policy;
  Amount weight{1'000'000'000'000'000ull};
  EXPECT_OUTCOME_TRUE(first, policy.cost(weight, 0));
  Amount previous = first;
  for (uint64_t elapsed = 1; elapsed < 5000; elapsed += 7) {
    EXPECT_OUTCOME_TRUE(current, policy.cost(weight, elapsed));
    ASSERT_LE(current, previous) << elapsed;
    previous = current;
  }
}

/**
 * @given a weight so large that weight * 3600 exceeds 256 bits
 * @when the cost is quoted
 * @then Overflow is reported
 */
TEST(SqrtDecayCostPolicyTest, Overflow) {
  SqrtDecayCostPolicy policy;
  EXPECT_EC(policy.cost(std::numeric_limits<Amount>::max() / 1000, 1),
            ArithmeticError::Overflow);
}
