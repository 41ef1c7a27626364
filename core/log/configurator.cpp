/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/configurator.hpp"

#include <boost/program_options.hpp>

namespace decai::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    const std::string embedded_config(R"(
# ----------------
sinks:
  - name: console
    type: console
    stream: stderr
    thread: none
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: decai
        children:
          - name: application
          - name: access
          - name: ledger
          - name: incentive
          - name: trainer
      - name: others
        children:
          - name: testing
# ----------------
  )");
  }  // namespace

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous)
      : ConfiguratorFromYAML(std::move(previous), embedded_config) {}

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous,
                             std::filesystem::path path)
      : ConfiguratorFromYAML(std::move(previous), std::move(path)) {}

  const std::string &Configurator::embeddedConfig() {
    return embedded_config;
  }

  std::optional<std::filesystem::path> Configurator::getLogConfigFile(
      int argc, const char **argv) {
    namespace po = boost::program_options;
    po::options_description desc;
    // `--log` is registered too, so that `--logcfg` is never taken for it
    desc.add_options()                                //
        ("logcfg", po::value<std::string>())          //
        ("log", po::value<std::vector<std::string>>());

    po::variables_map vm;
    try {
      po::store(po::command_line_parser(argc, argv)
                    .options(desc)
                    .allow_unregistered()
                    .run(),
                vm);
    } catch (const po::error &) {
      // the full option parsing reports it
      return std::nullopt;
    }

    if (vm.count("logcfg") == 0) {
      return std::nullopt;
    }
    return vm["logcfg"].as<std::string>();
  }

}  // namespace decai::log
