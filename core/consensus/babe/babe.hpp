/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "consensus/timeline/types.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace tessera::consensus::babe {

  /// Progress of the local authority in the current slot
  enum class ClaimState {
    Idle,
    Evaluating,
    /// leadership claimed, block is being proposed
    Claimed,
    Skipped,
  };

  inline std::string_view to_string(ClaimState state) {
    switch (state) {
      case ClaimState::Idle:
        return "Idle";
      case ClaimState::Evaluating:
        return "Evaluating";
      case ClaimState::Claimed:
        return "Claimed";
      case ClaimState::Skipped:
        return "Skipped";
    }
    return "Unknown";
  }

  /// BABE block production by the local authority
  class Babe {
   public:
    virtual ~Babe() = default;

    /// Starts processing ticks of the slot clock
    virtual void start() = 0;

    virtual void stop() = 0;

    /**
     * Decides whether the local authority authors a block in \param slot on
     * top of \param best_block and, if so, starts its proposal
     * @return Claimed or Skipped, error if the slot can't be evaluated
     */
    virtual outcome::result<ClaimState> processSlot(
        SlotNumber slot, const primitives::BlockInfo &best_block) = 0;

    virtual ClaimState state() const = 0;
  };

}  // namespace tessera::consensus::babe
