/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace tessera::application {

  /**
   * Codes for errors that originate in configuration readers
   */
  enum class ConfigReaderError {
    MISSING_ENTRY = 1,
    PARSER_ERROR,
    INVALID_VALUE,
  };

}  // namespace tessera::application

OUTCOME_HPP_DECLARE_ERROR(tessera::application, ConfigReaderError);
