/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/babe.hpp"

#include <atomic>

#include <boost/asio/io_context.hpp>

#include "consensus/babe/types/babe_configuration.hpp"
#include "consensus/babe/types/slot_leadership.hpp"
#include "log/logger.hpp"
#include "primitives/block.hpp"

namespace tessera::authorship {
  class Proposer;
}

namespace tessera::blockchain {
  class BlockTree;
}

namespace tessera::crypto {
  class Hasher;
  class KeyStore;
}  // namespace tessera::crypto

namespace tessera::consensus {
  class SlotClock;
  struct SlotTick;
}  // namespace tessera::consensus

namespace tessera::consensus::babe {
  class BabeLottery;
  class BlockHeaderAppender;
  class EpochTracker;
}  // namespace tessera::consensus::babe

namespace tessera::consensus::babe {

  class BabeImpl : public Babe, public std::enable_shared_from_this<BabeImpl> {
   public:
    /**
     * @param key_store custody of the local authority keys
     * @param block_appender records epoch change and claim of own blocks
     * @param worker context proposals run on
     */
    BabeImpl(std::shared_ptr<SlotClock> slot_clock,
             std::shared_ptr<blockchain::BlockTree> block_tree,
             std::shared_ptr<EpochTracker> epoch_tracker,
             std::shared_ptr<BabeLottery> lottery,
             std::shared_ptr<crypto::KeyStore> key_store,
             std::shared_ptr<authorship::Proposer> proposer,
             std::shared_ptr<BlockHeaderAppender> block_appender,
             std::shared_ptr<crypto::Hasher> hasher,
             std::shared_ptr<boost::asio::io_context> worker);

    void start() override;

    void stop() override;

    outcome::result<ClaimState> processSlot(
        SlotNumber slot, const primitives::BlockInfo &best_block) override;

    ClaimState state() const override;

   private:
    void onSlot(const SlotTick &tick);

    /// Index of the only local key among \param epoch authorities
    outcome::result<std::optional<primitives::AuthorityIndex>>
    findLocalAuthority(const Epoch &epoch) const;

    ClaimState skip();

    /// Builds, seals and stores a block; runs on the worker context
    outcome::result<void> propose(const primitives::BlockInfo &parent,
                                  const SlotClaim &claim,
                                  EpochNumber epoch);

    log::Logger log_;

    std::shared_ptr<SlotClock> slot_clock_;
    std::shared_ptr<blockchain::BlockTree> block_tree_;
    std::shared_ptr<EpochTracker> epoch_tracker_;
    std::shared_ptr<BabeLottery> lottery_;
    std::shared_ptr<crypto::KeyStore> key_store_;
    std::shared_ptr<authorship::Proposer> proposer_;
    std::shared_ptr<BlockHeaderAppender> block_appender_;
    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<boost::asio::io_context> worker_;

    std::atomic<ClaimState> state_{ClaimState::Idle};
    std::atomic_bool proposal_in_progress_{false};
  };

}  // namespace tessera::consensus::babe
