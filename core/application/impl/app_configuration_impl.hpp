/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <rapidjson/document.h>

#include "log/logger.hpp"

namespace decai::application {

  /// Operator identity used when neither the file nor the command line sets
  /// one
  inline const std::string kDefaultOperator =
      "0x0000000000000000000000000000000000000001";

  // clang-format off
  /**
   * Reads app configuration from multiple sources with the given priority:
   *
   *      COMMAND LINE ARGUMENTS          <- max priority
   *                V
   *        CONFIGURATION FILE
   *                V
   *          DEFAULT VALUES              <- low priority
   */
  // clang-format on

  class AppConfigurationImpl final : public AppConfiguration {
   public:
    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    /**
     * @return false if the application should not start: help was requested
     * or some value is malformed
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const incentive::IncentiveConfig &incentiveConfig() const override {
      return incentive_config_;
    }
    const primitives::Address &operatorAddress() const override {
      return operator_;
    }
    std::optional<std::filesystem::path> scenarioPath() const override {
      return scenario_path_;
    }
    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

   private:
    bool read_config_from_file(const std::string &filepath);
    bool parse_general_segment(const rapidjson::Value &val);
    bool parse_incentive_segment(const rapidjson::Value &val);

    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target);
    bool load_u64(const rapidjson::Value &val,
                  const char *name,
                  uint64_t &target);
    bool load_ms(const rapidjson::Value &val,
                 const char *name,
                 std::vector<std::string> &target);

    bool set_cost_weight(std::string_view str);
    bool set_operator(std::string_view str);

    log::Logger logger_;

    incentive::IncentiveConfig incentive_config_;
    primitives::Address operator_;
    std::optional<std::filesystem::path> scenario_path_;
    std::vector<std::string> logger_tuning_config_;
  };

}  // namespace decai::application
