/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "replay/scenario.hpp"

#include <fstream>
#include <sstream>
#include <string>

#include <rapidjson/document.h>

#include "primitives/parsing.hpp"

namespace decai::replay {

  namespace {
    using Value = rapidjson::Value;

    outcome::result<const Value *> member(const Value &obj, const char *name) {
      auto it = obj.FindMember(name);
      if (it == obj.MemberEnd()) {
        return ScenarioError::MISSING_FIELD;
      }
      return &it->value;
    }

    outcome::result<uint64_t> getU64(const Value &obj, const char *name) {
      OUTCOME_TRY(value, member(obj, name));
      if (not value->IsUint64()) {
        return ScenarioError::MISSING_FIELD;
      }
      return value->GetUint64();
    }

    outcome::result<std::string_view> getString(const Value &obj,
                                                const char *name) {
      OUTCOME_TRY(value, member(obj, name));
      if (not value->IsString()) {
        return ScenarioError::MISSING_FIELD;
      }
      return std::string_view{value->GetString(), value->GetStringLength()};
    }

    outcome::result<primitives::Address> getAddress(const Value &obj,
                                                    const char *name) {
      OUTCOME_TRY(str, getString(obj, name));
      return primitives::addressFromString(str);
    }

    // decimal string, or a plain number for amounts fitting 64 bits
    outcome::result<primitives::Amount> getAmount(const Value &obj,
                                                  const char *name) {
      OUTCOME_TRY(value, member(obj, name));
      if (value->IsUint64()) {
        return primitives::Amount{value->GetUint64()};
      }
      OUTCOME_TRY(str, getString(obj, name));
      return primitives::amountFromString(str);
    }

    outcome::result<Sample> getSample(const Value &obj) {
      OUTCOME_TRY(value, member(obj, "sample"));
      if (not value->IsArray()) {
        return ScenarioError::MISSING_FIELD;
      }
      Sample sample;
      sample.reserve(value->Size());
      for (const auto &element : value->GetArray()) {
        if (not element.IsInt64()) {
          return ScenarioError::MISSING_FIELD;
        }
        sample.push_back(element.GetInt64());
      }
      return sample;
    }

    outcome::result<Step> parseStep(const Value &obj) {
      if (not obj.IsObject()) {
        return ScenarioError::MISSING_FIELD;
      }
      OUTCOME_TRY(op, getString(obj, "op"));
      OUTCOME_TRY(sample, getSample(obj));
      OUTCOME_TRY(label, getU64(obj, "label"));

      if (op == "add") {
        OUTCOME_TRY(sender, getAddress(obj, "sender"));
        OUTCOME_TRY(paid, getAmount(obj, "paid"));
        OUTCOME_TRY(time, getU64(obj, "time"));
        return Step{AddStep{
            .sender = sender,
            .sample = std::move(sample),
            .label = label,
            .paid = paid,
            .time = time,
        }};
      }
      if (op == "refund") {
        OUTCOME_TRY(submitter, getAddress(obj, "submitter"));
        OUTCOME_TRY(added_time, getU64(obj, "added_time"));
        OUTCOME_TRY(time, getU64(obj, "time"));
        return Step{RefundStep{
            .submitter = submitter,
            .sample = std::move(sample),
            .label = label,
            .added_time = added_time,
            .time = time,
        }};
      }
      if (op == "report") {
        OUTCOME_TRY(reporter, getAddress(obj, "reporter"));
        OUTCOME_TRY(added_time, getU64(obj, "added_time"));
        OUTCOME_TRY(author, getAddress(obj, "author"));
        OUTCOME_TRY(time, getU64(obj, "time"));
        return Step{ReportStep{
            .reporter = reporter,
            .sample = std::move(sample),
            .label = label,
            .added_time = added_time,
            .original_author = author,
            .time = time,
        }};
      }
      if (op == "train") {
        return Step{TrainStep{.sample = std::move(sample), .label = label}};
      }
      return ScenarioError::UNKNOWN_OP;
    }
  }  // namespace

  outcome::result<Scenario> parseScenario(std::string_view json) {
    rapidjson::Document document;
    document.Parse(json.data(), json.size());
    if (document.HasParseError() or not document.IsObject()) {
      return ScenarioError::MALFORMED_JSON;
    }

    Scenario scenario;

    if (auto it = document.FindMember("model"); it != document.MemberEnd()) {
      if (not it->value.IsArray()) {
        return ScenarioError::MISSING_FIELD;
      }
      for (const auto &entry : it->value.GetArray()) {
        if (not entry.IsObject()) {
          return ScenarioError::MISSING_FIELD;
        }
        OUTCOME_TRY(sample, getSample(entry));
        OUTCOME_TRY(label, getU64(entry, "label"));
        scenario.model.push_back(
            ModelEntry{.sample = std::move(sample), .label = label});
      }
    }

    OUTCOME_TRY(steps, member(document, "steps"));
    if (not steps->IsArray()) {
      return ScenarioError::MISSING_FIELD;
    }
    for (const auto &entry : steps->GetArray()) {
      OUTCOME_TRY(step, parseStep(entry));
      scenario.steps.emplace_back(std::move(step));
    }
    return scenario;
  }

  outcome::result<Scenario> loadScenario(const std::filesystem::path &path) {
    std::ifstream file{path};
    if (not file.good()) {
      return ScenarioError::FILE_NOT_FOUND;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseScenario(buffer.str());
  }

}  // namespace decai::replay
