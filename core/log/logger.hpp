/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <qtils/strict_sptr.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "outcome/outcome.hpp"

namespace decai::log {

  using Level = soralog::Level;
  using Logger = qtils::StrictSharedPtr<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1, WRONG_GROUP, MALFORMED_FILTER };
  Q_ENUM_ERROR_CODE(Error) {
    using E = decltype(e);
    switch (e) {
      case E::WRONG_LEVEL:
        return "Unknown level";
      case E::WRONG_GROUP:
        return "Unknown group";
      case E::MALFORMED_FILTER:
        return "Log filter is neither `<level>` nor `<group>=<level>`";
    }
    abort();
  }

  static const std::string defaultGroupName("decai");

  /// Accepts the soralog level names and their short aliases (warn, err...)
  outcome::result<Level> str2lvl(std::string_view str);

  /// Must be called before any logger is created
  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Applies `--log` filters in order. A bare level sets the default group,
   * `group=level` sets the named one. Stops at the first bad filter.
   */
  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &filters);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group = defaultGroupName);

  bool setLevelOfGroup(const std::string &group_name, Level level);

}  // namespace decai::log
