/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/equivocation_detector_impl.hpp"

#include "consensus/timeline/slot_clock.hpp"
#include "crypto/hasher.hpp"

namespace tessera::consensus::babe {

  EquivocationDetectorImpl::EquivocationDetectorImpl(
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<SlotClock> slot_clock,
      SlotNumber slot_horizon)
      : hasher_(std::move(hasher)),
        slot_clock_(std::move(slot_clock)),
        slot_horizon_(slot_horizon),
        logger_(log::createLogger("EquivocationDetector", "equivocation")) {
    BOOST_ASSERT(hasher_ != nullptr);
    BOOST_ASSERT(slot_clock_ != nullptr);
  }

  std::optional<EquivocationProof> EquivocationDetectorImpl::observe(
      const primitives::AuthorityId &authority_id,
      SlotNumber slot,
      const primitives::BlockHeader &header) {
    auto hash = header.hash_opt;
    if (not hash.has_value()) {
      auto copy = header;
      primitives::calculateBlockHash(copy, *hasher_);
      hash = copy.hash_opt;
    }

    // headers may claim any slot, so the horizon follows the wall clock
    const auto current_slot = slot_clock_->currentSlot();

    std::lock_guard lock{mutex_};

    if (slot <= current_slot and current_slot - slot > slot_horizon_) {
      SL_TRACE(logger_,
               "Header #{} of slot {} is beyond the horizon, ignored",
               header.number,
               slot);
      return std::nullopt;
    }
    evict(current_slot);

    auto [it, inserted] = observed_[slot].try_emplace(authority_id);
    auto &observed = it->second;
    if (inserted) {
      observed.first_header = header;
      observed.seen.emplace(*hash);
      return std::nullopt;
    }

    if (not observed.seen.emplace(*hash).second) {
      return std::nullopt;
    }

    SL_WARN(logger_,
            "Authority {} produced several blocks in slot {}: {} and {}",
            authority_id,
            slot,
            observed.first_header.number,
            header.number);

    return EquivocationProof{
        .offender = authority_id,
        .slot = slot,
        .first_header = observed.first_header,
        .second_header = header,
    };
  }

  void EquivocationDetectorImpl::evict(SlotNumber current_slot) {
    if (current_slot <= slot_horizon_) {
      return;
    }
    observed_.erase(observed_.begin(),
                    observed_.lower_bound(current_slot - slot_horizon_));
  }

}  // namespace tessera::consensus::babe
