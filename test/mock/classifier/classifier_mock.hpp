/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "classifier/classifier.hpp"

#include <cstdint>
#include <vector>

#include <gmock/gmock.h>

namespace decai::classifier {

  template <typename SampleT = std::vector<int64_t>>
  class ClassifierMock : public Classifier<SampleT> {
   public:
    using Sample = SampleT;

    MOCK_METHOD2(update, void(const Sample &, primitives::Label));

    MOCK_CONST_METHOD1(predict, primitives::Label(const Sample &));
  };

}  // namespace decai::classifier
