/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace decai::primitives {

  enum class ParseError : uint8_t {
    EMPTY_INPUT = 1,
    NON_DIGIT_INPUT,
  };
  Q_ENUM_ERROR_CODE(ParseError) {
    using E = decltype(e);
    switch (e) {
      case E::EMPTY_INPUT:
        return "Empty input";
      case E::NON_DIGIT_INPUT:
        return "Amount contains non-decimal characters";
    }
    abort();
  }

  /// Decimal string to Amount, Overflow if it does not fit 256 bits
  outcome::result<Amount> amountFromString(std::string_view str);

  /// 0x-prefixed 40-digit hex string to Address
  outcome::result<Address> addressFromString(std::string_view str);

}  // namespace decai::primitives
