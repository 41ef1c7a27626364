/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace decai::common {

  /**
   * Coarse classes of failures, so a caller can decide whether to wait
   * (Timing), fix the request (Validation), or give up
   */
  enum class ErrorClass : uint8_t {
    Validation,
    Permission,
    Timing,
    Economic,
    Arithmetic,
    Unknown,
  };

  ErrorClass classifyError(const std::error_code &ec);

  std::string_view toString(ErrorClass error_class);

}  // namespace decai::common
