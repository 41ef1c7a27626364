/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace decai {

  /// Overload set built from lambdas
  template <typename... Lambdas>
  struct lambda_visitor : Lambdas... {
    using Lambdas::operator()...;
  };

  template <class... Fs>
  constexpr auto make_visitor(Fs &&...fs) {
    return lambda_visitor<std::decay_t<Fs>...>{std::forward<Fs>(fs)...};
  }

  /**
   * std::visit with the alternatives handled by lambdas at the call site:
   * @code
   *   visit_in_place(step,
   *                  [&](const AddStep &s) { ... },
   *                  [&](const TrainStep &s) { ... });
   * @endcode
   */
  template <typename TVariant, typename... TVisitors>
  constexpr decltype(auto) visit_in_place(TVariant &&variant,
                                          TVisitors &&...visitors) {
    return std::visit(make_visitor(std::forward<TVisitors>(visitors)...),
                      std::forward<TVariant>(variant));
  }

}  // namespace decai
