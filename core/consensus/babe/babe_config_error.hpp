/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/types/babe_configuration.hpp"
#include "outcome/outcome.hpp"

namespace tessera::consensus::babe {

  enum class ConfigError {
    INVALID_LEADERSHIP_RATE = 1,
    ZERO_EPOCH_LENGTH,
    ZERO_SLOT_DURATION,
    EMPTY_AUTHORITIES,
    ZERO_AUTHORITY_WEIGHT,
    MULTIPLE_LOCAL_AUTHORITIES,
    INVALID_ALLOWED_SLOTS,
  };

  /// Checks that \param config describes a chain BABE can run on
  outcome::result<void> validateConfiguration(const BabeConfiguration &config);

  /// Checks parameters which may change with every epoch
  outcome::result<void> validateEpochConfiguration(
      const EpochConfiguration &config);

  /// Checks authority set of an epoch
  outcome::result<void> validateAuthorities(
      const primitives::AuthorityList &authorities);

}  // namespace tessera::consensus::babe

OUTCOME_HPP_DECLARE_ERROR(tessera::consensus::babe, ConfigError)
