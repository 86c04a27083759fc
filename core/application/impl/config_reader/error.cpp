/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/config_reader/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tessera::application, ConfigReaderError, e) {
  using E = tessera::application::ConfigReaderError;
  switch (e) {
    case E::MISSING_ENTRY:
      return "A required entry is missing in the provided config file";
    case E::PARSER_ERROR:
      return "Internal parser error";
    case E::INVALID_VALUE:
      return "An entry of the provided config file has invalid value";
  }
  return "Unknown error";
}
