/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "outcome/outcome.hpp"

namespace decai::primitives {

  enum class ArithmeticError : uint8_t {
    /// Underflow.
    Underflow = 1,
    /// Overflow.
    Overflow,
    /// Division by zero.
    DivisionByZero,
  };
  Q_ENUM_ERROR_CODE(ArithmeticError) {
    using E = decltype(e);
    switch (e) {
      case E::Underflow:
        return "An underflow would occur";
      case E::Overflow:
        return "An overflow would occur";
      case E::DivisionByZero:
        return "Division by zero";
    }
    abort();
  }

}  // namespace decai::primitives
