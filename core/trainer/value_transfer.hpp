/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace decai::trainer {

  /// Moves value out of escrow to a participant
  class ValueTransfer {
   public:
    virtual ~ValueTransfer() = default;

    virtual outcome::result<void> transfer(
        const primitives::Address &to, const primitives::Amount &amount) = 0;
  };

}  // namespace decai::trainer
