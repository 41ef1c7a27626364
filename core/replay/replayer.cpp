/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "replay/replayer.hpp"

#include <boost/assert.hpp>

#include "common/error_class.hpp"
#include "common/visitor.hpp"

namespace decai::replay {

  namespace {
    std::string_view opName(const Step &step) {
      return visit_in_place(
          step,
          [](const AddStep &) { return "add"; },
          [](const RefundStep &) { return "refund"; },
          [](const ReportStep &) { return "report"; },
          [](const TrainStep &) { return "train"; });
    }
  }  // namespace

  Replayer::Replayer(std::shared_ptr<Trainer> trainer)
      : trainer_(std::move(trainer)),
        log_(log::createLogger("Replayer", "application")) {
    BOOST_ASSERT(trainer_ != nullptr);
  }

  void Replayer::seed(const std::vector<ModelEntry> &model) {
    for (const auto &entry : model) {
      trainer_->train(entry.sample, entry.label);
    }
    SL_DEBUG(log_, "Model seeded with {} samples", model.size());
  }

  outcome::result<void> Replayer::apply(const Step &step) {
    return visit_in_place(
        step,
        [&](const AddStep &s) -> outcome::result<void> {
          OUTCOME_TRY(
              cost,
              trainer_->addData(s.sender, s.sample, s.label, s.paid, s.time));
          SL_INFO(log_, "{} added data at {}, cost {}", s.sender, s.time, cost);
          return outcome::success();
        },
        [&](const RefundStep &s) -> outcome::result<void> {
          OUTCOME_TRY(amount,
                      trainer_->refund(
                          s.submitter, s.sample, s.label, s.added_time, s.time));
          SL_INFO(log_, "{} refunded {}", s.submitter, amount);
          return outcome::success();
        },
        [&](const ReportStep &s) -> outcome::result<void> {
          OUTCOME_TRY(amount,
                      trainer_->report(s.reporter,
                                       s.sample,
                                       s.label,
                                       s.added_time,
                                       s.original_author,
                                       s.time));
          SL_INFO(log_,
                  "{} reported data of {}, rewarded {}",
                  s.reporter,
                  s.original_author,
                  amount);
          return outcome::success();
        },
        [&](const TrainStep &s) -> outcome::result<void> {
          trainer_->train(s.sample, s.label);
          SL_INFO(log_, "Model retrained to label {}", s.label);
          return outcome::success();
        });
  }

  ReplaySummary Replayer::run(const Scenario &scenario) {
    seed(scenario.model);

    ReplaySummary summary;
    for (size_t i = 0; i < scenario.steps.size(); ++i) {
      const auto &step = scenario.steps[i];
      auto res = apply(step);
      if (res.has_error()) {
        SL_WARN(log_,
                "Step #{} ({}) failed: {} [{}]",
                i,
                opName(step),
                res.error().message(),
                common::toString(common::classifyError(res.error())));
        summary.failures.push_back(StepFailure{.index = i, .error = res.error()});
        continue;
      }
      ++summary.succeeded;
    }
    SL_INFO(log_,
            "Replay finished: {} steps succeeded, {} failed",
            summary.succeeded,
            summary.failures.size());
    return summary;
  }

}  // namespace decai::replay
