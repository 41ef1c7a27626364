/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <cstdio>
#include <iostream>
#include <memory>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <boost/program_options.hpp>

#include "primitives/parsing.hpp"

namespace {

  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

  FilePtr open_file(const std::string &filepath) {
    return {std::fopen(filepath.c_str(), "r"), &std::fclose};
  }

  constexpr auto kGeneralSegment = "general";
  constexpr auto kIncentiveSegment = "incentive";

}  // namespace

namespace decai::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)),
        operator_(primitives::addressFromString(kDefaultOperator).value()) {}

  bool AppConfigurationImpl::load_str(const rapidjson::Value &val,
                                      const char *name,
                                      std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsString()) {
      target.assign(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u64(const rapidjson::Value &val,
                                      const char *name,
                                      uint64_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint64()) {
      target = m->value.GetUint64();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_ms(const rapidjson::Value &val,
                                     const char *name,
                                     std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m) {
      return false;
    }
    if (m->value.IsString()) {
      target.emplace_back(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    if (not m->value.IsArray()) {
      return false;
    }
    for (const auto &value : m->value.GetArray()) {
      if (value.IsString()) {
        target.emplace_back(value.GetString(), value.GetStringLength());
      }
    }
    return not target.empty();
  }

  bool AppConfigurationImpl::set_cost_weight(std::string_view str) {
    auto res = primitives::amountFromString(str);
    if (res.has_error()) {
      SL_ERROR(logger_,
               "Invalid cost weight '{}': {}",
               str,
               res.error().message());
      return false;
    }
    incentive_config_.cost_weight = res.value();
    return true;
  }

  bool AppConfigurationImpl::set_operator(std::string_view str) {
    auto res = primitives::addressFromString(str);
    if (res.has_error()) {
      SL_ERROR(
          logger_, "Invalid operator '{}': {}", str, res.error().message());
      return false;
    }
    operator_ = res.value();
    return true;
  }

  bool AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    load_ms(val, "log", logger_tuning_config_);

    std::string str;
    if (load_str(val, "scenario", str)) {
      scenario_path_ = str;
    }
    if (load_str(val, "operator", str) and not set_operator(str)) {
      return false;
    }
    return true;
  }

  bool AppConfigurationImpl::parse_incentive_segment(
      const rapidjson::Value &val) {
    std::string cost_weight;
    if (load_str(val, "cost-weight", cost_weight)
        and not set_cost_weight(cost_weight)) {
      return false;
    }
    load_u64(val, "refund-wait", incentive_config_.refund_wait_time);
    load_u64(val, "owner-claim-wait", incentive_config_.owner_claim_wait_time);
    load_u64(val,
             "any-address-claim-wait",
             incentive_config_.any_address_claim_wait_time);
    load_u64(val, "start-time", incentive_config_.start_time);
    return true;
  }

  bool AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with -c option",
               filepath);
      return false;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer_size{};
    FileReadStream input_stream(
        file.get(), buffer_size.data(), buffer_size.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return false;
    }
    if (not document.IsObject()) {
      SL_ERROR(logger_, "Configuration file {} is not an object", filepath);
      return false;
    }

    if (auto it = document.FindMember(kGeneralSegment);
        it != document.MemberEnd() and not parse_general_segment(it->value)) {
      return false;
    }
    if (auto it = document.FindMember(kIncentiveSegment);
        it != document.MemberEnd()
        and not parse_incentive_segment(it->value)) {
      return false;
    }
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<group>=<level>`, e.g. -lledger=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all groups log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Yaml file overriding the embedded logging configuration")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ("scenario,s", po::value<std::string>(), "Json scenario to replay")
        ("operator", po::value<std::string>(), "0x-prefixed address owning the ledger and the engine")
        ;

    po::options_description incentive_desc("Incentive options");
    incentive_desc.add_options()
        ("cost-weight", po::value<std::string>(), "Submission fee scale, decimal")
        ("refund-wait", po::value<uint64_t>(), "Seconds before a submitter may claim a refund")
        ("owner-claim-wait", po::value<uint64_t>(), "Seconds before the owner may sweep a deposit")
        ("any-address-claim-wait", po::value<uint64_t>(), "Seconds before anyone may sweep a deposit")
        ("start-time", po::value<uint64_t>(), "Initial last-update time used for pricing")
        ;
    // clang-format on

    desc.add(incentive_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    bool success = true;

    find_argument<std::string>(vm, "config-file", [&](const std::string &path) {
      success = read_config_from_file(path);
    });
    if (not success) {
      return false;
    }

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) {
          logger_tuning_config_.insert(
              logger_tuning_config_.end(), val.begin(), val.end());
        });

    find_argument<std::string>(vm, "scenario", [&](const std::string &path) {
      scenario_path_ = path;
    });

    find_argument<std::string>(vm, "operator", [&](const std::string &val) {
      success = set_operator(val) and success;
    });

    find_argument<std::string>(vm, "cost-weight", [&](const std::string &val) {
      success = set_cost_weight(val) and success;
    });

    find_argument<uint64_t>(vm, "refund-wait", [&](uint64_t val) {
      incentive_config_.refund_wait_time = val;
    });
    find_argument<uint64_t>(vm, "owner-claim-wait", [&](uint64_t val) {
      incentive_config_.owner_claim_wait_time = val;
    });
    find_argument<uint64_t>(vm, "any-address-claim-wait", [&](uint64_t val) {
      incentive_config_.any_address_claim_wait_time = val;
    });
    find_argument<uint64_t>(vm, "start-time", [&](uint64_t val) {
      incentive_config_.start_time = val;
    });

    if (not success) {
      return false;
    }

    if (auto res = incentive::validate(incentive_config_); res.has_error()) {
      SL_ERROR(logger_,
               "Wait times must satisfy refund <= owner claim <= any address "
               "claim, got {} / {} / {}: {}",
               incentive_config_.refund_wait_time,
               incentive_config_.owner_claim_wait_time,
               incentive_config_.any_address_claim_wait_time,
               res.error().message());
      return false;
    }

    return true;
  }

}  // namespace decai::application
