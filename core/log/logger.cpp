/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <utility>

#include <boost/assert.hpp>

namespace decai::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(logging_system,
                       "decai::log::setLoggingSystem() was not called, "
                       "or the logging system is already gone");
      return logging_system;
    }

    constexpr std::array<std::pair<std::string_view, Level>, 13> kLevelNames{{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO},
        {"inf", Level::INFO},
        {"warning", Level::WARN},
        {"warn", Level::WARN},
        {"error", Level::ERROR},
        {"err", Level::ERROR},
        {"critical", Level::CRITICAL},
        {"crit", Level::CRITICAL},
        {"off", Level::OFF},
        {"no", Level::OFF},
    }};
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    for (const auto &[name, level] : kLevelNames) {
      if (name == str) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
  }

  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &filters) {
    auto logging_system = loggingSystem();

    for (std::string_view filter : filters) {
      auto eq = filter.find('=');
      if (eq == std::string_view::npos) {
        OUTCOME_TRY(level, str2lvl(filter));
        logging_system->setLevelOfGroup(defaultGroupName, level);
        continue;
      }

      std::string group{filter.substr(0, eq)};
      auto level_name = filter.substr(eq + 1);
      if (group.empty() or level_name.empty()) {
        return Error::MALFORMED_FILTER;
      }
      if (not logging_system->getGroup(group)) {
        return Error::WRONG_GROUP;
      }
      OUTCOME_TRY(level, str2lvl(level_name));
      logging_system->setLevelOfGroup(group, level);
    }
    return outcome::success();
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return std::static_pointer_cast<soralog::LoggerFactory>(loggingSystem())
        ->getLogger(tag, group);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return loggingSystem()->setLevelOfGroup(group_name, level);
  }

}  // namespace decai::log
