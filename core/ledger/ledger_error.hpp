/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace decai::ledger {

  enum class LedgerError : uint8_t {
    KeyCollision = 1,
    NotFound,
    Mismatch,
    InsufficientBalance,
  };
  Q_ENUM_ERROR_CODE(LedgerError) {
    using E = decltype(e);
    switch (e) {
      case E::KeyCollision:
        return "A live contribution is already recorded under this key";
      case E::NotFound:
        return "Contribution not found";
      case E::Mismatch:
        return "Stored contribution does not match the given label, time or "
               "submitter";
      case E::InsufficientBalance:
        return "Debit exceeds the claimable amount";
    }
    abort();
  }

}  // namespace decai::ledger
