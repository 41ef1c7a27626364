/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"
#include "utils/safe_object.hpp"

namespace decai::access {

  enum class AccessError : uint8_t {
    Unauthorized = 1,
  };
  Q_ENUM_ERROR_CODE(AccessError) {
    using E = decltype(e);
    switch (e) {
      case E::Unauthorized:
        return "Caller is not the owner";
    }
    abort();
  }

  /**
   * Single-holder capability. Mutating entry points of the ledger and the
   * incentive engine call require() with the caller identity inside their
   * own state lock, and transfer() is taken under that same lock, so a
   * check and the mutation it guards see the same holder.
   */
  class OwnerGate {
   public:
    OwnerGate(primitives::Address owner, std::string name);

    primitives::Address owner() const;

    outcome::result<void> require(const primitives::Address &caller) const;

    /// Hands the capability over; only the current holder may do so
    outcome::result<void> transfer(const primitives::Address &caller,
                                   const primitives::Address &new_owner);

   private:
    SafeObject<primitives::Address> owner_;
    std::string name_;
    log::Logger log_;
  };

}  // namespace decai::access
