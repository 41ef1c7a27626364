/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "access/owner_gate.hpp"

namespace decai::access {

  OwnerGate::OwnerGate(primitives::Address owner, std::string name)
      : owner_(owner),
        name_(std::move(name)),
        log_(log::createLogger("OwnerGate", "access")) {}

  primitives::Address OwnerGate::owner() const {
    return owner_.sharedAccess([](const auto &owner) { return owner; });
  }

  outcome::result<void> OwnerGate::require(
      const primitives::Address &caller) const {
    return owner_.sharedAccess(
        [&](const auto &owner) -> outcome::result<void> {
          if (caller != owner) {
            SL_VERBOSE(log_, "{}: call from {} rejected", name_, caller);
            return AccessError::Unauthorized;
          }
          return outcome::success();
        });
  }

  outcome::result<void> OwnerGate::transfer(
      const primitives::Address &caller, const primitives::Address &new_owner) {
    return owner_.exclusiveAccess(
        [&](auto &owner) -> outcome::result<void> {
          if (caller != owner) {
            SL_WARN(log_,
                    "{}: ownership transfer by {} rejected, owner is {}",
                    name_,
                    caller,
                    owner);
            return AccessError::Unauthorized;
          }
          SL_INFO(log_, "{}: ownership moved {} -> {}", name_, owner, new_owner);
          owner = new_owner;
          return outcome::success();
        });
  }

}  // namespace decai::access
