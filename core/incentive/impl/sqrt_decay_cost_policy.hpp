/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "incentive/cost_policy.hpp"

namespace decai::incentive {

  /**
   * cost = weight * 3600 / floor(sqrt(elapsed)), with the divisor forced to
   * 1 when no time has passed. Ignores the sample content.
   */
  class SqrtDecayCostPolicy final : public CostPolicy {
   public:
    static constexpr uint64_t kSecondsPerHour = 3600;

    outcome::result<primitives::Amount> cost(
        const primitives::Amount &cost_weight,
        primitives::Timestamp elapsed) const override;
  };

}  // namespace decai::incentive
