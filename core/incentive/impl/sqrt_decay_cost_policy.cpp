/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "incentive/impl/sqrt_decay_cost_policy.hpp"

#include "primitives/math.hpp"

namespace decai::incentive {

  outcome::result<primitives::Amount> SqrtDecayCostPolicy::cost(
      const primitives::Amount &cost_weight,
      primitives::Timestamp elapsed) const {
    primitives::Timestamp divisor = 1;
    if (elapsed != 0) {
      divisor = math::isqrt(elapsed);
    }
    OUTCOME_TRY(scaled,
                math::checkedMul(cost_weight,
                                 primitives::Amount{kSecondsPerHour}));
    return math::checkedDiv(scaled, primitives::Amount{divisor});
  }

}  // namespace decai::incentive
