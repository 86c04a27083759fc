/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/babe_impl.hpp"

#include <boost/asio/post.hpp>

#include "authorship/proposer.hpp"
#include "blockchain/block_tree.hpp"
#include "consensus/babe/babe_config_error.hpp"
#include "consensus/babe/babe_lottery.hpp"
#include "consensus/babe/block_header_appender.hpp"
#include "consensus/babe/epoch_tracker.hpp"
#include "consensus/babe/impl/babe_digests_util.hpp"
#include "consensus/timeline/slot_clock.hpp"
#include "crypto/hasher.hpp"
#include "crypto/key_store.hpp"

namespace tessera::consensus::babe {

  BabeImpl::BabeImpl(std::shared_ptr<SlotClock> slot_clock,
                     std::shared_ptr<blockchain::BlockTree> block_tree,
                     std::shared_ptr<EpochTracker> epoch_tracker,
                     std::shared_ptr<BabeLottery> lottery,
                     std::shared_ptr<crypto::KeyStore> key_store,
                     std::shared_ptr<authorship::Proposer> proposer,
                     std::shared_ptr<BlockHeaderAppender> block_appender,
                     std::shared_ptr<crypto::Hasher> hasher,
                     std::shared_ptr<boost::asio::io_context> worker)
      : log_(log::createLogger("Babe", "babe")),
        slot_clock_(std::move(slot_clock)),
        block_tree_(std::move(block_tree)),
        epoch_tracker_(std::move(epoch_tracker)),
        lottery_(std::move(lottery)),
        key_store_(std::move(key_store)),
        proposer_(std::move(proposer)),
        block_appender_(std::move(block_appender)),
        hasher_(std::move(hasher)),
        worker_(std::move(worker)) {
    BOOST_ASSERT(slot_clock_);
    BOOST_ASSERT(block_tree_);
    BOOST_ASSERT(epoch_tracker_);
    BOOST_ASSERT(lottery_);
    BOOST_ASSERT(key_store_);
    BOOST_ASSERT(proposer_);
    BOOST_ASSERT(block_appender_);
    BOOST_ASSERT(hasher_);
    BOOST_ASSERT(worker_);
  }

  void BabeImpl::start() {
    slot_clock_->start([wp{weak_from_this()}](const SlotTick &tick) {
      if (auto self = wp.lock()) {
        self->onSlot(tick);
      }
    });
  }

  void BabeImpl::stop() {
    slot_clock_->stop();
  }

  ClaimState BabeImpl::state() const {
    return state_.load();
  }

  void BabeImpl::onSlot(const SlotTick &tick) {
    auto best_block = block_tree_->bestBlock();
    auto res = processSlot(tick.slot, best_block);
    if (res.has_error()) {
      SL_WARN(log_,
              "Slot {} on top of {} can't be processed: {}",
              tick.slot,
              best_block,
              res.error().message());
    }
  }

  outcome::result<ClaimState> BabeImpl::processSlot(
      SlotNumber slot, const primitives::BlockInfo &best_block) {
    if (proposal_in_progress_.load()) {
      SL_DEBUG(log_,
               "Slot {} is skipped: proposal of the previous block is still "
               "in progress",
               slot);
      return skip();
    }

    state_ = ClaimState::Evaluating;

    if (best_block.number != 0) {
      auto best_header_res = block_tree_->getBlockHeader(best_block.hash);
      if (best_header_res.has_error()) {
        skip();
        return best_header_res.as_failure();
      }
      auto best_slot_res = getSlot(best_header_res.value());
      if (best_slot_res.has_value() and best_slot_res.value() >= slot) {
        SL_DEBUG(log_,
                 "Slot {} is skipped: best block {} is already in slot {}",
                 slot,
                 best_block,
                 best_slot_res.value());
        return skip();
      }
    }

    auto epoch_res = epoch_tracker_->epochForSlot(best_block.hash, slot);
    if (epoch_res.has_error()) {
      skip();
      return epoch_res.as_failure();
    }
    const auto &epoch = epoch_res.value();

    auto local_res = findLocalAuthority(epoch);
    if (local_res.has_error()) {
      SL_ERROR(log_,
               "Slot {} is skipped: {}",
               slot,
               local_res.error().message());
      skip();
      return local_res.as_failure();
    }
    if (not local_res.value().has_value()) {
      SL_TRACE(log_, "Node is not active validator in {}", epoch);
      return skip();
    }
    auto authority_index = local_res.value().value();

    auto claim_res = lottery_->getSlotLeadership(epoch, slot, authority_index);
    if (claim_res.has_error()) {
      if (claim_res.error() == crypto::KeyStoreError::KEY_NOT_AVAILABLE) {
        SL_VERBOSE(log_,
                   "Slot {} is skipped: key of authority #{} is not "
                   "available",
                   slot,
                   authority_index);
        return skip();
      }
      skip();
      return claim_res.as_failure();
    }
    if (not claim_res.value().has_value()) {
      SL_TRACE(log_, "Node is not slot leader in slot {} {}", slot, epoch);
      return skip();
    }
    auto claim = std::move(claim_res.value().value());

    SL_VERBOSE(log_,
               "Obtained {} slot leadership in slot {} {}",
               to_string(claim.slot_type),
               slot,
               epoch);

    state_ = ClaimState::Claimed;
    proposal_in_progress_ = true;

    SL_INFO(log_, "Node builds block on top of block {}", best_block);

    boost::asio::post(*worker_,
                      [wp{weak_from_this()},
                       parent = best_block,
                       claim = std::move(claim),
                       epoch_index = epoch.epoch_index] {
                        if (auto self = wp.lock()) {
                          auto res = self->propose(parent, claim, epoch_index);
                          if (res.has_error()) {
                            SL_ERROR(self->log_,
                                     "Cannot propose a block: {}",
                                     res.error().message());
                          }
                          self->proposal_in_progress_ = false;
                        }
                      });

    return ClaimState::Claimed;
  }

  ClaimState BabeImpl::skip() {
    state_ = ClaimState::Skipped;
    return ClaimState::Skipped;
  }

  outcome::result<std::optional<primitives::AuthorityIndex>>
  BabeImpl::findLocalAuthority(const Epoch &epoch) const {
    std::optional<primitives::AuthorityIndex> found;
    for (primitives::AuthorityIndex index = 0;
         index < epoch.authorities.size();
         ++index) {
      if (not key_store_->hasKey(epoch.authorities[index].id)) {
        continue;
      }
      if (found.has_value()) {
        return ConfigError::MULTIPLE_LOCAL_AUTHORITIES;
      }
      found = index;
    }
    return found;
  }

  outcome::result<void> BabeImpl::propose(const primitives::BlockInfo &parent,
                                          const SlotClaim &claim,
                                          EpochNumber epoch) {
    BabeBlockHeader babe_header{
        .slot_assignment_type = claim.slot_type,
        .authority_index = claim.authority_index,
        .slot_number = claim.slot,
        .epoch_index = epoch,
        .vrf_output = claim.vrf_output,
    };

    OUTCOME_TRY(block, proposer_->propose(parent, {makePreDigest(babe_header)}));

    // Note: it is temporary hash significant for signing
    primitives::calculateBlockHash(block.header, *hasher_);

    auto signature_res =
        key_store_->sign(claim.authority_id, block.header.hash());
    if (signature_res.has_error()) {
      SL_ERROR(log_,
               "Error signing a block seal: {}",
               signature_res.error().message());
      return signature_res.as_failure();
    }

    // add seal digest item
    block.header.digest.emplace_back(
        makeSealDigest(Seal{.signature = signature_res.value()}));

    // Calculate and save hash, 'cause seal digest was added
    primitives::calculateBlockHash(block.header, *hasher_);

    const auto block_info = block.header.blockInfo();

    // announced epoch must be tracked before the block can be built on
    if (auto append_res = block_appender_->appendAuthoredHeader(block.header);
        append_res.has_error()) {
      SL_ERROR(log_,
               "Built block {} is rejected: {}",
               block_info,
               append_res.error().message());
      return append_res.as_failure();
    }

    if (auto add_res = block_tree_->addBlock(block); add_res.has_error()) {
      SL_ERROR(log_,
               "Could not add block {}: {}",
               block_info,
               add_res.error().message());
      return add_res.as_failure();
    }

    SL_INFO(log_,
            "Built block {} in slot {} (epoch {})",
            block_info,
            claim.slot,
            epoch);
    return outcome::success();
  }

}  // namespace tessera::consensus::babe
