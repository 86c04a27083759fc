/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/epoch_tracker.hpp"

#include <optional>
#include <shared_mutex>
#include <unordered_map>

#include "log/logger.hpp"

namespace tessera::blockchain {
  class BlockTree;
}

namespace tessera::consensus::babe {

  /// Epoch announced by a block
  struct EpochChange {
    primitives::BlockInfo block;
    Epoch epoch;
    /// nearest ancestor change; none for the oldest retained one
    std::optional<primitives::BlockHash> parent;
  };

  class EpochTrackerImpl final : public EpochTracker {
   public:
    /**
     * @param block_tree source of headers for walking ancestry
     * @param genesis_epoch epoch announced by the genesis block
     */
    EpochTrackerImpl(std::shared_ptr<blockchain::BlockTree> block_tree,
                     Epoch genesis_epoch);

    outcome::result<Epoch> epochFor(
        const primitives::BlockHash &block_hash) const override;

    outcome::result<Epoch> epochForSlot(const primitives::BlockHash &parent_hash,
                                        SlotNumber slot) const override;

    outcome::result<void> importEpochChange(
        const primitives::BlockInfo &block,
        const primitives::BlockHash &parent_hash,
        const Epoch &epoch) override;

    outcome::result<void> prune(
        const primitives::BlockHash &finalized_hash) override;

    primitives::BlockInfo root() const override;

   private:
    /// Nearest change at or above \param hash reachable without passing root
    outcome::result<primitives::BlockHash> findChange(
        primitives::BlockHash hash) const;

    /// Epoch of \param slot on the chain of changes starting at \param from
    outcome::result<Epoch> resolveEpoch(const primitives::BlockHash &from,
                                        SlotNumber slot) const;

    /// Change whose epoch covers \param slot, without extending
    std::optional<primitives::BlockHash> changeInEffect(
        const primitives::BlockHash &from, SlotNumber slot) const;

    bool isDescendantOf(
        const primitives::BlockInfo &block,
        const primitives::BlockInfo &ancestor) const;

    std::shared_ptr<blockchain::BlockTree> block_tree_;

    mutable std::shared_mutex mutex_;
    primitives::BlockInfo root_;
    primitives::BlockHash root_change_;
    std::unordered_map<primitives::BlockHash, EpochChange> changes_;

    log::Logger logger_;
  };

}  // namespace tessera::consensus::babe
