/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "classifier/classifier.hpp"
#include "replay/scenario.hpp"

namespace decai::replay {

  /**
   * Scripted model: remembers the last label taught for each sample and
   * predicts `kUnknownLabel` for samples it has never seen
   */
  class LookupClassifier final : public classifier::Classifier<Sample> {
   public:
    static constexpr primitives::Label kUnknownLabel = 0;

    void update(const Sample &sample, primitives::Label label) override {
      labels_.insert_or_assign(sample, label);
    }

    primitives::Label predict(const Sample &sample) const override {
      auto it = labels_.find(sample);
      return it == labels_.end() ? kUnknownLabel : it->second;
    }

    size_t size() const {
      return labels_.size();
    }

   private:
    std::map<Sample, primitives::Label> labels_;
  };

}  // namespace decai::replay
