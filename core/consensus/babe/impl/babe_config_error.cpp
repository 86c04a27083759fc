/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/babe_config_error.hpp"

#include <algorithm>

OUTCOME_CPP_DEFINE_CATEGORY(tessera::consensus::babe, ConfigError, e) {
  using E = tessera::consensus::babe::ConfigError;
  switch (e) {
    case E::INVALID_LEADERSHIP_RATE:
      return "leadership rate must be a fraction in (0, 1]";
    case E::ZERO_EPOCH_LENGTH:
      return "epoch length must be positive";
    case E::ZERO_SLOT_DURATION:
      return "slot duration must be positive";
    case E::EMPTY_AUTHORITIES:
      return "authority set is empty";
    case E::ZERO_AUTHORITY_WEIGHT:
      return "authority weight must be positive";
    case E::MULTIPLE_LOCAL_AUTHORITIES:
      return "several keys of the authority set are held locally";
    case E::INVALID_ALLOWED_SLOTS:
      return "unknown kind of allowed slots";
  }
  return "unknown error (tessera::consensus::babe::ConfigError)";
}

namespace tessera::consensus::babe {

  outcome::result<void> validateEpochConfiguration(
      const EpochConfiguration &config) {
    const auto &[numerator, denominator] = config.leadership_rate;
    if (numerator == 0 or denominator == 0 or numerator > denominator) {
      return ConfigError::INVALID_LEADERSHIP_RATE;
    }
    switch (config.allowed_slots) {
      case AllowedSlots::PrimaryOnly:
      case AllowedSlots::PrimaryAndSecondaryPlain:
      case AllowedSlots::PrimaryAndSecondaryVRF:
        return outcome::success();
    }
    return ConfigError::INVALID_ALLOWED_SLOTS;
  }

  outcome::result<void> validateAuthorities(
      const primitives::AuthorityList &authorities) {
    if (authorities.empty()) {
      return ConfigError::EMPTY_AUTHORITIES;
    }
    if (std::ranges::any_of(authorities, [](const auto &authority) {
          return authority.weight == 0;
        })) {
      return ConfigError::ZERO_AUTHORITY_WEIGHT;
    }
    return outcome::success();
  }

  outcome::result<void> validateConfiguration(const BabeConfiguration &config) {
    if (config.slot_duration.count() <= 0) {
      return ConfigError::ZERO_SLOT_DURATION;
    }
    if (config.epoch_length == 0) {
      return ConfigError::ZERO_EPOCH_LENGTH;
    }
    OUTCOME_TRY(validateEpochConfiguration(config.epoch_config));
    return validateAuthorities(config.authorities);
  }

}  // namespace tessera::consensus::babe
