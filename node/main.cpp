/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <filesystem>
#include <iostream>

#include <fmt/format.h>
#include <soralog/impl/configurator_from_yaml.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "incentive/impl/sqrt_decay_cost_policy.hpp"
#include "incentive/impl/staking_engine.hpp"
#include "ledger/impl/ledger_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"
#include "replay/lookup_classifier.hpp"
#include "replay/replayer.hpp"
#include "trainer/impl/balance_book.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

using decai::application::AppConfigurationImpl;

namespace {
  int run_replay(const decai::application::AppConfiguration &configuration) {
    auto logger = decai::log::createLogger("Main", "application");

    auto scenario_path = configuration.scenarioPath();
    if (not scenario_path.has_value()) {
      SL_ERROR(logger, "No scenario given, use --scenario <file.json>");
      return EXIT_FAILURE;
    }

    auto scenario = decai::replay::loadScenario(scenario_path.value());
    if (scenario.has_error()) {
      SL_ERROR(logger,
               "Can not load scenario {}: {}",
               scenario_path->string(),
               scenario.error().message());
      return EXIT_FAILURE;
    }

    const auto &operator_address = configuration.operatorAddress();

    auto engine = decai::incentive::StakingEngine::create(
        operator_address,
        configuration.incentiveConfig(),
        std::make_shared<decai::incentive::SqrtDecayCostPolicy>());
    if (engine.has_error()) {
      SL_ERROR(logger,
               "Can not create incentive engine: {}",
               engine.error().message());
      return EXIT_FAILURE;
    }

    auto ledger =
        std::make_shared<decai::ledger::LedgerImpl>(operator_address);
    auto model = std::make_shared<decai::replay::LookupClassifier>();
    auto balance_book = std::make_shared<decai::trainer::BalanceBook>();

    auto trainer = std::make_shared<decai::replay::Trainer>(
        operator_address,
        ledger,
        std::shared_ptr<decai::incentive::IncentiveEngine>(
            std::move(engine.value())),
        model,
        balance_book);

    SL_INFO(logger,
            "Replaying {} steps of {} as operator {}",
            scenario.value().steps.size(),
            scenario_path->string(),
            operator_address);

    decai::replay::Replayer replayer(trainer);
    auto summary = replayer.run(scenario.value());

    for (const auto &[address, balance] : balance_book->balances()) {
      fmt::print("{} {}\n", address, balance);
    }
    fmt::print("total paid {}, {} steps succeeded, {} failed\n",
               balance_book->totalPaid(),
               summary.succeeded,
               summary.failures.size());
    return EXIT_SUCCESS;
  }
}  // namespace

int main(int argc, const char **argv) {
  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        decai::log::Configurator::getLogConfigFile(argc, argv);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto embedded_configurator =
        std::make_shared<soralog::ConfiguratorFromYAML>(
            decai::log::Configurator::embeddedConfig());

    std::shared_ptr<soralog::Configurator> configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<decai::log::Configurator>(
                  std::move(embedded_configurator),
                  custom_log_config_path.value())
            : std::static_pointer_cast<soralog::Configurator>(
                  std::move(embedded_configurator));

    return std::make_shared<soralog::LoggingSystem>(std::move(configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  decai::log::setLoggingSystem(logging_system);

  auto configuration = std::make_shared<AppConfigurationImpl>(
      decai::log::createLogger("AppConfiguration", "application"));

  if (not configuration->initializeFromArgs(argc, argv)) {
    return EXIT_FAILURE;
  }

  if (auto res = decai::log::tuneLoggingSystem(configuration->log());
      res.has_error()) {
    std::cerr << "Bad --log value: " << res.error().message() << '\n';
    return EXIT_FAILURE;
  }

  int exit_code = run_replay(*configuration);

  auto logger = decai::log::createLogger("Main");
  SL_INFO(logger, "Replay complete");
  logger->flush();

  return exit_code;
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
