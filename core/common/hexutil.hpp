/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace decai::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
  };
  Q_ENUM_ERROR_CODE(UnhexError) {
    using E = decltype(e);
    switch (e) {
      case E::NOT_ENOUGH_INPUT:
        return "Input contains odd number of characters";
      case E::NON_HEX_INPUT:
        return "Input contains non-hex characters";
      case E::MISSING_0X_PREFIX:
        return "Missing expected 0x prefix";
    }
    abort();
  }

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes source bytes
   * @return hexstring without prefix
   */
  std::string hex_lower(std::span<const uint8_t> bytes);

  /**
   * @brief Converts bytes to lowercase hex representation with prefix 0x
   */
  std::string hex_lower_0x(std::span<const uint8_t> bytes);

  /**
   * @brief Unhex string, reads both uppercase and lowercase digits
   * @param hex hex string without prefix
   * @return decoded bytes if input has even length and only hex digits
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   */
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

}  // namespace decai::common
