/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "trainer/impl/balance_book.hpp"

#include "primitives/math.hpp"

namespace decai::trainer {

  outcome::result<void> BalanceBook::transfer(
      const primitives::Address &to, const primitives::Amount &amount) {
    return balances_.exclusiveAccess(
        [&](auto &balances) -> outcome::result<void> {
          auto it = balances.find(to);
          primitives::Amount current =
              it == balances.end() ? primitives::Amount{0} : it->second;
          OUTCOME_TRY(credited, math::checkedAdd(current, amount));
          balances.insert_or_assign(to, credited);
          return outcome::success();
        });
  }

  primitives::Amount BalanceBook::balanceOf(
      const primitives::Address &address) const {
    return balances_.sharedAccess([&](const auto &balances) {
      auto it = balances.find(address);
      return it == balances.end() ? primitives::Amount{0} : it->second;
    });
  }

  primitives::Amount BalanceBook::totalPaid() const {
    return balances_.sharedAccess([](const auto &balances) {
      primitives::Amount total{0};
      for (const auto &[_, balance] : balances) {
        total += balance;
      }
      return total;
    });
  }

  std::map<primitives::Address, primitives::Amount> BalanceBook::balances()
      const {
    return balances_.sharedAccess(
        [](const auto &balances) { return balances; });
  }

}  // namespace decai::trainer
