/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/error_class.hpp"

#include "access/owner_gate.hpp"
#include "common/blob.hpp"
#include "incentive/incentive_error.hpp"
#include "ledger/ledger_error.hpp"
#include "primitives/arithmetic_error.hpp"
#include "primitives/parsing.hpp"

namespace decai::common {

  namespace {
    template <typename E>
    bool isOf(const std::error_code &ec) {
      return ec.category() == std::error_code{E{1}}.category();
    }
  }  // namespace

  ErrorClass classifyError(const std::error_code &ec) {
    using incentive::IncentiveError;
    using ledger::LedgerError;

    if (isOf<LedgerError>(ec)) {
      if (ec == LedgerError::InsufficientBalance) {
        return ErrorClass::Arithmetic;
      }
      return ErrorClass::Validation;
    }
    if (isOf<IncentiveError>(ec)) {
      if (ec == IncentiveError::ClockRegression
          or ec == IncentiveError::TooEarly) {
        return ErrorClass::Timing;
      }
      if (ec == IncentiveError::InvalidConfig) {
        return ErrorClass::Validation;
      }
      return ErrorClass::Economic;
    }
    if (isOf<access::AccessError>(ec)) {
      return ErrorClass::Permission;
    }
    if (isOf<primitives::ArithmeticError>(ec)) {
      return ErrorClass::Arithmetic;
    }
    if (isOf<UnhexError>(ec) or isOf<BlobError>(ec)
        or isOf<primitives::ParseError>(ec)) {
      return ErrorClass::Validation;
    }
    return ErrorClass::Unknown;
  }

  std::string_view toString(ErrorClass error_class) {
    switch (error_class) {
      case ErrorClass::Validation:
        return "validation";
      case ErrorClass::Permission:
        return "permission";
      case ErrorClass::Timing:
        return "timing";
      case ErrorClass::Economic:
        return "economic";
      case ErrorClass::Arithmetic:
        return "arithmetic";
      case ErrorClass::Unknown:
        break;
    }
    return "unknown";
  }

}  // namespace decai::common
