/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "incentive/incentive_config.hpp"
#include "primitives/common.hpp"

namespace decai::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return staking parameters of the incentive engine
     */
    virtual const incentive::IncentiveConfig &incentiveConfig() const = 0;

    /**
     * @return identity that owns the ledger and the engine
     */
    virtual const primitives::Address &operatorAddress() const = 0;

    /**
     * @return scenario to replay, if any
     */
    virtual std::optional<std::filesystem::path> scenarioPath() const = 0;

    /**
     * @return `--log` tuning values
     */
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace decai::application
