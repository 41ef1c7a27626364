/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include <boost/signals2.hpp>

namespace decai::common {

  /// Per-instance signal carrying one event type
  template <typename Event>
  class EventEmitter {
   public:
    using EventHandler = void(const Event &);
    using Connection = boost::signals2::connection;

    Connection subscribe(const std::function<EventHandler> &handler) {
      return signal_.connect(handler);
    }

    void fire(const Event &event) const {
      signal_(event);
    }

   private:
    mutable boost::signals2::signal<EventHandler> signal_;
  };

}  // namespace decai::common
