/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace decai::incentive {

  /**
   * Submission fee curve. The engine handles a zero weight and clock
   * regressions itself and asks the policy only for the price after
   * `elapsed` idle seconds.
   */
  class CostPolicy {
   public:
    virtual ~CostPolicy() = default;

    virtual outcome::result<primitives::Amount> cost(
        const primitives::Amount &cost_weight,
        primitives::Timestamp elapsed) const = 0;
  };

}  // namespace decai::incentive
