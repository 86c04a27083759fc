/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace tessera::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
    UNKNOWN
  };

  /**
   * @brief Converts bytes to hex representation in lower case
   */
  std::string hex_lower(std::span<const uint8_t> bytes);

  /**
   * @brief Same as hex_lower, prefixed with 0x
   */
  std::string hex_lower_0x(std::span<const uint8_t> bytes);

  /**
   * @brief Converts hex representation to bytes
   * @param hex hex string without prefix
   * @return bytes or UnhexError
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   */
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

}  // namespace tessera::common

OUTCOME_HPP_DECLARE_ERROR(tessera::common, UnhexError);
