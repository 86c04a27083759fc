/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/block_header_appender.hpp"

#include <mutex>
#include <unordered_map>

#include "consensus/babe/types/equivocation_proof.hpp"
#include "log/logger.hpp"

namespace tessera::blockchain {
  class BlockTree;
}

namespace tessera::crypto {
  class Hasher;
}

namespace tessera::runtime {
  class BabeApi;
}

namespace tessera::consensus::babe {
  class EpochTracker;
  class EquivocationDetector;
}  // namespace tessera::consensus::babe

namespace tessera::consensus::babe {

  class BlockHeaderAppenderImpl : public BlockHeaderAppender {
   public:
    BlockHeaderAppenderImpl(
        std::shared_ptr<blockchain::BlockTree> block_tree,
        std::shared_ptr<crypto::Hasher> hasher,
        std::shared_ptr<BabeBlockValidator> block_validator,
        std::shared_ptr<EpochTracker> epoch_tracker,
        std::shared_ptr<EquivocationDetector> equivocation_detector,
        std::shared_ptr<runtime::BabeApi> babe_api);

    outcome::result<ImportedHeader> appendHeader(
        primitives::BlockHeader &&block_header) override;

    outcome::result<ImportedHeader> appendAuthoredHeader(
        const primitives::BlockHeader &block_header) override;

    outcome::result<void> onFinalized(
        const primitives::BlockInfo &finalized) override;

   private:
    outcome::result<ImportedHeader> importHeader(
        primitives::BlockHeader block_header, bool store_header);

    struct WeightRecord {
      primitives::BlockNumber number;
      ForkWeight weight;
    };

    /// Records the next epoch if \param header is the first of its epoch
    outcome::result<void> applyEpochChange(
        const primitives::BlockHeader &header,
        const primitives::BlockHeader &parent_header,
        const VerifiedSeal &seal);

    void reportEquivocation(const primitives::BlockHash &at,
                            const EquivocationProof &proof) const;

    /// Mutex serializing imports of children of \param parent_hash
    std::shared_ptr<std::mutex> parentLock(
        const primitives::BlockHash &parent_hash);

    std::shared_ptr<blockchain::BlockTree> block_tree_;
    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<BabeBlockValidator> block_validator_;
    std::shared_ptr<EpochTracker> epoch_tracker_;
    std::shared_ptr<EquivocationDetector> equivocation_detector_;
    std::shared_ptr<runtime::BabeApi> babe_api_;

    std::mutex parent_locks_mutex_;
    std::unordered_map<primitives::BlockHash, std::weak_ptr<std::mutex>>
        parent_locks_;

    std::mutex weights_mutex_;
    std::unordered_map<primitives::BlockHash, WeightRecord> weights_;

    log::Logger logger_;
  };

}  // namespace tessera::consensus::babe
