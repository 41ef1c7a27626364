/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "trainer/value_transfer.hpp"

#include <map>

#include "utils/safe_object.hpp"

namespace decai::trainer {

  /// In-memory payout book: credits every transfer to the receiver
  class BalanceBook final : public ValueTransfer {
   public:
    outcome::result<void> transfer(const primitives::Address &to,
                                   const primitives::Amount &amount) override;

    primitives::Amount balanceOf(const primitives::Address &address) const;

    /// Sum of everything paid out so far
    primitives::Amount totalPaid() const;

    std::map<primitives::Address, primitives::Amount> balances() const;

   private:
    SafeObject<std::map<primitives::Address, primitives::Amount>> balances_;
  };

}  // namespace decai::trainer
