/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <system_error>
#include <vector>

#include "log/logger.hpp"
#include "replay/scenario.hpp"
#include "trainer/collaborative_trainer.hpp"

namespace decai::replay {

  using Trainer = trainer::CollaborativeTrainer<Sample>;

  struct StepFailure {
    size_t index;
    std::error_code error;
  };

  struct ReplaySummary {
    size_t succeeded = 0;
    std::vector<StepFailure> failures;
  };

  /**
   * Drives a trainer through the steps of a scenario in order. A failing
   * step is logged and recorded, the replay goes on with the next one.
   */
  class Replayer {
   public:
    explicit Replayer(std::shared_ptr<Trainer> trainer);

    /// Teaches the scripted model its initial labels, bypassing staking
    void seed(const std::vector<ModelEntry> &model);

    ReplaySummary run(const Scenario &scenario);

   private:
    outcome::result<void> apply(const Step &step);

    std::shared_ptr<Trainer> trainer_;
    log::Logger log_;
  };

}  // namespace decai::replay
