/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>
#include <type_traits>

#include "outcome/outcome.hpp"
#include "primitives/arithmetic_error.hpp"
#include "primitives/common.hpp"

namespace decai::math {

  template <typename T>
  concept UnsignedInteger =
      (std::numeric_limits<T>::is_integer
       and not std::numeric_limits<T>::is_signed)
      or std::is_same_v<T, primitives::Amount>;

  /**
   * Integer square root by Newton iteration, no floating point involved.
   * @return the largest r such that r * r <= n
   */
  template <UnsignedInteger T>
  T isqrt(const T &n) {
    if (n < 2) {
      return n;
    }
    // start from ceil(n / 2) and descend; every step stays >= floor(sqrt(n))
    T y = n;
    T z = n / 2 + n % 2;
    while (z < y) {
      y = z;
      z = (n / z + z) / 2;
    }
    return y;
  }

  using primitives::Amount;
  using primitives::ArithmeticError;

  inline outcome::result<Amount> checkedAdd(const Amount &x, const Amount &y) {
    Amount res = x + y;
    if (res < x) {
      return ArithmeticError::Overflow;
    }
    return res;
  }

  inline outcome::result<Amount> checkedSub(const Amount &x, const Amount &y) {
    if (x < y) {
      return ArithmeticError::Underflow;
    }
    return x - y;
  }

  inline outcome::result<Amount> checkedMul(const Amount &x, const Amount &y) {
    if (x == 0 or y == 0) {
      return Amount{0};
    }
    Amount res = x * y;
    if (res / x != y) {
      return ArithmeticError::Overflow;
    }
    return res;
  }

  inline outcome::result<Amount> checkedDiv(const Amount &x, const Amount &y) {
    if (y == 0) {
      return ArithmeticError::DivisionByZero;
    }
    return x / y;
  }

  template <typename T, typename E>
  inline outcome::result<void> checked_sub(T &x, const T &y, E e) {
    if (x >= y) {
      x -= y;
      return outcome::success();
    }
    return e;
  }

}  // namespace decai::math
