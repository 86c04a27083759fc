/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/types/babe_configuration.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace tessera::consensus::babe {

  enum class EpochTrackerError {
    UNKNOWN_BLOCK = 1,
    INVALID_PARENT,
    STALE_EPOCH,
  };

  /**
   * Fork-aware record of epoch changes. Each fork sees the epochs announced
   * on its own ancestry only.
   */
  class EpochTracker {
   public:
    virtual ~EpochTracker() = default;

    /// Epoch in effect at the own slot of block \param block_hash
    virtual outcome::result<Epoch> epochFor(
        const primitives::BlockHash &block_hash) const = 0;

    /// Epoch a child of \param parent_hash claiming \param slot belongs to
    virtual outcome::result<Epoch> epochForSlot(
        const primitives::BlockHash &parent_hash, SlotNumber slot) const = 0;

    /**
     * Records \param epoch announced by block \param block
     * @return INVALID_PARENT if \param parent_hash is not tracked,
     * STALE_EPOCH if the epoch does not extend the epoch of the parent fork
     */
    virtual outcome::result<void> importEpochChange(
        const primitives::BlockInfo &block,
        const primitives::BlockHash &parent_hash,
        const Epoch &epoch) = 0;

    /**
     * Forgets everything not descending from \param finalized_hash and
     * every epoch older than the one in effect at it
     */
    virtual outcome::result<void> prune(
        const primitives::BlockHash &finalized_hash) = 0;

    /// Oldest block the tracker answers for
    virtual primitives::BlockInfo root() const = 0;
  };

}  // namespace tessera::consensus::babe

OUTCOME_HPP_DECLARE_ERROR(tessera::consensus::babe, EpochTrackerError)
