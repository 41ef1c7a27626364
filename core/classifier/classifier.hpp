/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/common.hpp"

namespace decai::classifier {

  /**
   * The trained model. Both calls must be deterministic given the sequence
   * of updates applied so far.
   * @tparam Sample sample representation, e.g. std::vector<int64_t>
   */
  template <typename Sample>
  class Classifier {
   public:
    virtual ~Classifier() = default;

    virtual void update(const Sample &sample, primitives::Label label) = 0;

    virtual primitives::Label predict(const Sample &sample) const = 0;
  };

}  // namespace decai::classifier
