/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string_view>
#include <variant>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace decai::replay {

  using Sample = std::vector<int64_t>;

  enum class ScenarioError : uint8_t {
    FILE_NOT_FOUND = 1,
    MALFORMED_JSON,
    MISSING_FIELD,
    UNKNOWN_OP,
  };
  Q_ENUM_ERROR_CODE(ScenarioError) {
    using E = decltype(e);
    switch (e) {
      case E::FILE_NOT_FOUND:
        return "Scenario file can not be opened";
      case E::MALFORMED_JSON:
        return "Scenario is not valid json";
      case E::MISSING_FIELD:
        return "Scenario entry lacks a field or has it of a wrong type";
      case E::UNKNOWN_OP:
        return "Scenario step has an unknown op";
    }
    abort();
  }

  /// Label the scripted model initially holds for a sample
  struct ModelEntry {
    Sample sample;
    primitives::Label label;
  };

  struct AddStep {
    primitives::Address sender;
    Sample sample;
    primitives::Label label;
    primitives::Amount paid;
    primitives::Timestamp time;
  };

  struct RefundStep {
    primitives::Address submitter;
    Sample sample;
    primitives::Label label;
    primitives::Timestamp added_time;
    primitives::Timestamp time;
  };

  struct ReportStep {
    primitives::Address reporter;
    Sample sample;
    primitives::Label label;
    primitives::Timestamp added_time;
    primitives::Address original_author;
    primitives::Timestamp time;
  };

  /// Changes the scripted model without staking anything
  struct TrainStep {
    Sample sample;
    primitives::Label label;
  };

  using Step = std::variant<AddStep, RefundStep, ReportStep, TrainStep>;

  struct Scenario {
    std::vector<ModelEntry> model;
    std::vector<Step> steps;
  };

  /**
   * Parses a scenario document:
   * {"model": [{"sample": [..], "label": n}],
   *  "steps": [{"op": "add", "sender": "0x..", "sample": [..], "label": n,
   *             "paid": "<decimal>", "time": t}, ...]}
   * Refund steps carry "submitter" and "added_time", report steps
   * "reporter", "author" and "added_time".
   */
  outcome::result<Scenario> parseScenario(std::string_view json);

  outcome::result<Scenario> loadScenario(const std::filesystem::path &path);

}  // namespace decai::replay
