/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/equivocation_detector.hpp"

#include <map>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include "log/logger.hpp"

namespace tessera::crypto {
  class Hasher;
}

namespace tessera::consensus {
  class SlotClock;
}

namespace tessera::consensus::babe {

  class EquivocationDetectorImpl final : public EquivocationDetector {
   public:
    /**
     * @param slot_clock source of the current slot, which the horizon is
     * counted back from
     * @param slot_horizon number of slots behind the current one for which
     * headers are remembered
     */
    EquivocationDetectorImpl(std::shared_ptr<crypto::Hasher> hasher,
                             std::shared_ptr<SlotClock> slot_clock,
                             SlotNumber slot_horizon);

    std::optional<EquivocationProof> observe(
        const primitives::AuthorityId &authority_id,
        SlotNumber slot,
        const primitives::BlockHeader &header) override;

   private:
    struct Observed {
      primitives::BlockHeader first_header;
      std::unordered_set<primitives::BlockHash> seen;
    };

    /// Drops records more than the horizon behind \param current_slot
    void evict(SlotNumber current_slot);

    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<SlotClock> slot_clock_;
    const SlotNumber slot_horizon_;

    std::mutex mutex_;
    std::map<SlotNumber,
             std::unordered_map<primitives::AuthorityId, Observed>>
        observed_;

    log::Logger logger_;
  };

}  // namespace tessera::consensus::babe
