/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "consensus/babe/types/babe_configuration.hpp"

namespace tessera::application {

  /**
   * Contains configuration parameters of the consensus: chain timings,
   * genesis authorities and logging overrides
   */
  struct TesseraConfig {
    /// default number of slots equivocations are tracked for
    static constexpr consensus::SlotNumber kDefaultSlotHorizon = 256;

    consensus::babe::BabeConfiguration babe;
    /// first slot of the genesis epoch
    consensus::SlotNumber genesis_slot = 0;
    consensus::SlotNumber equivocation_slot_horizon = kDefaultSlotHorizon;
    /// `group=level` overrides of the logging system
    std::vector<std::string> log;

    bool operator==(const TesseraConfig &other) const = default;
  };

}  // namespace tessera::application
