/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/parsing.hpp"

#include "primitives/math.hpp"

namespace decai::primitives {

  outcome::result<Amount> amountFromString(std::string_view str) {
    if (str.empty()) {
      return ParseError::EMPTY_INPUT;
    }
    Amount result{0};
    const Amount ten{10};
    for (auto c : str) {
      if (c < '0' or c > '9') {
        return ParseError::NON_DIGIT_INPUT;
      }
      OUTCOME_TRY(shifted, math::checkedMul(result, ten));
      OUTCOME_TRY(added, math::checkedAdd(shifted, Amount{c - '0'}));
      result = added;
    }
    return result;
  }

  outcome::result<Address> addressFromString(std::string_view str) {
    if (str.empty()) {
      return ParseError::EMPTY_INPUT;
    }
    return Address::fromHexWithPrefix(str);
  }

}  // namespace decai::primitives
