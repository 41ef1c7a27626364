/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace decai {

  // clang-format off
  /**
   * Protected object wrapper. Every access runs the given functor while
   * holding the lock, so one access is one serialized unit.
   * @tparam T object type
   * Example:
   * @code
   *  SafeObject<std::map<Key, Record>> records;
   *  auto found = records.sharedAccess([&](const auto &map) {
   *    return map.contains(key);
   *  });
   *  records.exclusiveAccess([&](auto &map) {
   *    map.emplace(key, record);
   *  });
   * @endcode
   */
  // clang-format on
  template <typename T, typename M = std::shared_mutex>
  struct SafeObject {
    using Type = T;

    template <typename... Args>
    SafeObject(Args &&...args) : t_(std::forward<Args>(args)...) {}

    template <typename F>
    inline auto exclusiveAccess(F &&f) {
      std::unique_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

    template <typename F>
    inline auto sharedAccess(F &&f) const {
      std::shared_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

   private:
    T t_;
    mutable M cs_;
  };

}  // namespace decai
