/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/block_header_appender_impl.hpp"

#include "blockchain/block_tree.hpp"
#include "blockchain/block_tree_error.hpp"
#include "consensus/babe/babe_config_error.hpp"
#include "consensus/babe/epoch_tracker.hpp"
#include "consensus/babe/equivocation_detector.hpp"
#include "consensus/babe/impl/babe_digests_util.hpp"
#include "runtime/runtime_api/babe_api.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tessera::consensus::babe, BlockAdditionError, e) {
  using E = tessera::consensus::babe::BlockAdditionError;
  switch (e) {
    case E::PARENT_NOT_FOUND:
      return "parent of the block is not found";
    case E::EXPECTED_EPOCH_CHANGE:
      return "the first block of an epoch must announce the next epoch";
    case E::UNEXPECTED_EPOCH_CHANGE:
      return "only the first block of an epoch may announce the next epoch";
  }
  return "unknown error (tessera::consensus::babe::BlockAdditionError)";
}

namespace tessera::consensus::babe {

  BlockHeaderAppenderImpl::BlockHeaderAppenderImpl(
      std::shared_ptr<blockchain::BlockTree> block_tree,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<BabeBlockValidator> block_validator,
      std::shared_ptr<EpochTracker> epoch_tracker,
      std::shared_ptr<EquivocationDetector> equivocation_detector,
      std::shared_ptr<runtime::BabeApi> babe_api)
      : block_tree_{std::move(block_tree)},
        hasher_{std::move(hasher)},
        block_validator_{std::move(block_validator)},
        epoch_tracker_{std::move(epoch_tracker)},
        equivocation_detector_{std::move(equivocation_detector)},
        babe_api_{std::move(babe_api)},
        logger_{log::createLogger("BlockHeaderAppender", "block_appender")} {
    BOOST_ASSERT(block_tree_ != nullptr);
    BOOST_ASSERT(hasher_ != nullptr);
    BOOST_ASSERT(block_validator_ != nullptr);
    BOOST_ASSERT(epoch_tracker_ != nullptr);
    BOOST_ASSERT(equivocation_detector_ != nullptr);
    BOOST_ASSERT(babe_api_ != nullptr);

    weights_.emplace(block_tree_->getGenesisBlockHash(), WeightRecord{0, 0});
  }

  outcome::result<ImportedHeader> BlockHeaderAppenderImpl::appendHeader(
      primitives::BlockHeader &&block_header) {
    return importHeader(std::move(block_header), true);
  }

  outcome::result<ImportedHeader> BlockHeaderAppenderImpl::appendAuthoredHeader(
      const primitives::BlockHeader &block_header) {
    return importHeader(block_header, false);
  }

  outcome::result<ImportedHeader> BlockHeaderAppenderImpl::importHeader(
      primitives::BlockHeader block_header, bool store_header) {
    primitives::calculateBlockHash(block_header, *hasher_);
    auto block_info = block_header.blockInfo();

    auto parent_res = block_tree_->getBlockHeader(block_header.parent_hash);
    if (parent_res.has_error()) {
      if (parent_res.error() == blockchain::BlockTreeError::HEADER_NOT_FOUND) {
        SL_WARN(logger_, "Skipping a block {} with unknown parent", block_info);
        return BlockAdditionError::PARENT_NOT_FOUND;
      }
      return parent_res.as_failure();
    }
    const auto &parent_header = parent_res.value();

    OUTCOME_TRY(seal,
                block_validator_->validateHeader(block_header, parent_header));

    {
      auto parent_lock = parentLock(block_header.parent_hash);
      std::lock_guard lock{*parent_lock};

      // repeated import of a known epoch change is a no-op, so a stored
      // block still gets its announcement tracked
      OUTCOME_TRY(applyEpochChange(block_header, parent_header, seal));

      if (not store_header) {
        SL_DEBUG(logger_, "Header of own block {} is recorded", block_info);
      } else if (auto header_res = block_tree_->getBlockHeader(block_info.hash);
                 header_res.has_value()) {
        SL_DEBUG(logger_, "Skip existing header of block: {}", block_info);
      } else {
        OUTCOME_TRY(block_tree_->addBlockHeader(block_header));
      }
    }

    if (auto proof = equivocation_detector_->observe(
            seal.authority_id, seal.slot, block_header);
        proof.has_value()) {
      reportEquivocation(block_header.parent_hash, proof.value());
    }

    ForkWeight weight = 0;
    {
      std::lock_guard lock{weights_mutex_};
      ForkWeight parent_weight = 0;
      if (auto it = weights_.find(block_header.parent_hash);
          it != weights_.end()) {
        parent_weight = it->second.weight;
      } else {
        SL_DEBUG(logger_,
                 "Weight of parent of block {} is unknown, counting from zero",
                 block_info);
      }
      weight = cumulativeWeight(parent_weight, weightIncrement(seal.slot_type));
      weights_[block_info.hash] = WeightRecord{block_info.number, weight};
    }

    SL_VERBOSE(logger_,
               "Imported header of block {} ({} slot {}, authority #{}, "
               "weight {})",
               block_info,
               to_string(seal.slot_type),
               seal.slot,
               seal.authority_index,
               weight);

    return ImportedHeader{
        .block = block_info,
        .seal = std::move(seal),
        .weight = weight,
    };
  }

  outcome::result<void> BlockHeaderAppenderImpl::onFinalized(
      const primitives::BlockInfo &finalized) {
    OUTCOME_TRY(epoch_tracker_->prune(finalized.hash));

    std::lock_guard lock{weights_mutex_};
    std::erase_if(weights_, [&](const auto &item) {
      return item.second.number < finalized.number;
    });
    return outcome::success();
  }

  outcome::result<void> BlockHeaderAppenderImpl::applyEpochChange(
      const primitives::BlockHeader &header,
      const primitives::BlockHeader &parent_header,
      const VerifiedSeal &seal) {
    OUTCOME_TRY(epoch,
                epoch_tracker_->epochForSlot(header.parent_hash, seal.slot));

    bool first_in_epoch = true;
    if (parent_header.number != 0) {
      OUTCOME_TRY(parent_epoch, epoch_tracker_->epochFor(header.parent_hash));
      first_in_epoch = parent_epoch.epoch_index != epoch.epoch_index;
    }

    OUTCOME_TRY(next_epoch_digest, getNextEpochDigest(header));

    if (not first_in_epoch) {
      if (next_epoch_digest.has_value()) {
        SL_VERBOSE(logger_,
                   "Block #{} is not the first of {}, but announces the next",
                   header.number,
                   epoch);
        return BlockAdditionError::UNEXPECTED_EPOCH_CHANGE;
      }
      return outcome::success();
    }

    if (not next_epoch_digest.has_value()) {
      SL_VERBOSE(logger_,
                 "Block #{} is the first of {}, but does not announce the next",
                 header.number,
                 epoch);
      return BlockAdditionError::EXPECTED_EPOCH_CHANGE;
    }

    OUTCOME_TRY(validateAuthorities(next_epoch_digest->authorities));

    OUTCOME_TRY(next_config_digest, getNextConfigDigest(header));
    if (next_config_digest.has_value()) {
      OUTCOME_TRY(validateEpochConfiguration(next_config_digest.value()));
    }

    Epoch next_epoch{
        .epoch_index = epoch.epoch_index + 1,
        .start_slot = epoch.start_slot + epoch.duration,
        .duration = epoch.duration,
        .authorities = std::move(next_epoch_digest->authorities),
        .randomness = next_epoch_digest->randomness,
        .config = next_config_digest.value_or(epoch.config),
    };

    return epoch_tracker_->importEpochChange(
        header.blockInfo(), header.parent_hash, next_epoch);
  }

  void BlockHeaderAppenderImpl::reportEquivocation(
      const primitives::BlockHash &at, const EquivocationProof &proof) const {
    auto ownership_proof_res = babe_api_->generate_key_ownership_proof(
        at, proof.slot, proof.offender);
    if (ownership_proof_res.has_error()) {
      SL_WARN(logger_,
              "Can't get key ownership proof for equivocation report: {}",
              ownership_proof_res.error().message());
      return;
    }
    auto &ownership_proof_opt = ownership_proof_res.value();
    if (not ownership_proof_opt.has_value()) {
      SL_WARN(logger_,
              "Equivocation report in slot {} is not submitted: equivocator "
              "{} is not in the authority set",
              proof.slot,
              proof.offender);
      return;
    }

    auto submit_res =
        babe_api_->submit_report_equivocation_unsigned_extrinsic(
            at, proof, std::move(ownership_proof_opt.value()));
    if (submit_res.has_error()) {
      SL_WARN(logger_,
              "Can't submit equivocation report: {}",
              submit_res.error().message());
      return;
    }

    SL_INFO(logger_,
            "Equivocation of {} in slot {} reported",
            proof.offender,
            proof.slot);
  }

  std::shared_ptr<std::mutex> BlockHeaderAppenderImpl::parentLock(
      const primitives::BlockHash &parent_hash) {
    std::lock_guard lock{parent_locks_mutex_};
    std::erase_if(parent_locks_,
                  [](const auto &item) { return item.second.expired(); });
    auto &slot = parent_locks_[parent_hash];
    auto mutex = slot.lock();
    if (mutex == nullptr) {
      mutex = std::make_shared<std::mutex>();
      slot = mutex;
    }
    return mutex;
  }

}  // namespace tessera::consensus::babe
