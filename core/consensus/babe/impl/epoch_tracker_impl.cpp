/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/epoch_tracker_impl.hpp"

#include <unordered_set>

#include "blockchain/block_tree.hpp"
#include "consensus/babe/impl/babe_digests_util.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tessera::consensus::babe, EpochTrackerError, e) {
  using E = tessera::consensus::babe::EpochTrackerError;
  switch (e) {
    case E::UNKNOWN_BLOCK:
      return "block is unknown or does not descend from the last finalized "
             "block";
    case E::INVALID_PARENT:
      return "parent of the block announcing an epoch is not tracked";
    case E::STALE_EPOCH:
      return "announced epoch does not follow the epoch of its fork";
  }
  return "unknown error (tessera::consensus::babe::EpochTrackerError)";
}

namespace tessera::consensus::babe {

  EpochTrackerImpl::EpochTrackerImpl(
      std::shared_ptr<blockchain::BlockTree> block_tree, Epoch genesis_epoch)
      : block_tree_(std::move(block_tree)),
        logger_(log::createLogger("EpochTracker", "epoch_tracker")) {
    BOOST_ASSERT(block_tree_ != nullptr);
    BOOST_ASSERT(genesis_epoch.duration != 0);

    root_ = {0, block_tree_->getGenesisBlockHash()};
    root_change_ = root_.hash;
    changes_.emplace(root_.hash,
                     EpochChange{
                         .block = root_,
                         .epoch = std::move(genesis_epoch),
                         .parent = std::nullopt,
                     });
  }

  outcome::result<Epoch> EpochTrackerImpl::epochFor(
      const primitives::BlockHash &block_hash) const {
    std::shared_lock lock{mutex_};

    auto header_res = block_tree_->getBlockHeader(block_hash);
    if (header_res.has_error()) {
      return EpochTrackerError::UNKNOWN_BLOCK;
    }
    const auto &header = header_res.value();

    OUTCOME_TRY(from, findChange(block_hash));
    if (header.number == 0) {
      return changes_.at(from).epoch;
    }

    OUTCOME_TRY(slot, getSlot(header));
    return resolveEpoch(from, slot);
  }

  outcome::result<Epoch> EpochTrackerImpl::epochForSlot(
      const primitives::BlockHash &parent_hash, SlotNumber slot) const {
    std::shared_lock lock{mutex_};
    OUTCOME_TRY(from, findChange(parent_hash));
    return resolveEpoch(from, slot);
  }

  outcome::result<void> EpochTrackerImpl::importEpochChange(
      const primitives::BlockInfo &block,
      const primitives::BlockHash &parent_hash,
      const Epoch &epoch) {
    BOOST_ASSERT(epoch.duration != 0);
    std::unique_lock lock{mutex_};

    if (auto it = changes_.find(block.hash); it != changes_.end()) {
      if (it->second.block == block and it->second.epoch == epoch) {
        SL_TRACE(logger_, "Epoch change of block {} is already known", block);
        return outcome::success();
      }
      return EpochTrackerError::STALE_EPOCH;
    }

    auto parent_res = findChange(parent_hash);
    if (parent_res.has_error()) {
      SL_DEBUG(logger_,
               "Parent {} of block {} announcing {} is not tracked: {}",
               parent_hash,
               block,
               epoch,
               parent_res.error().message());
      return EpochTrackerError::INVALID_PARENT;
    }
    const auto &parent_change = parent_res.value();

    auto stale = [&] {
      SL_DEBUG(logger_, "Block {} announces stale {}", block, epoch);
      return EpochTrackerError::STALE_EPOCH;
    };

    if (epoch.start_slot == 0) {
      return stale();
    }
    auto previous_res = resolveEpoch(parent_change, epoch.start_slot - 1);
    if (previous_res.has_error()) {
      return stale();
    }
    const auto &previous = previous_res.value();

    auto same_data = [&](const Epoch &other) {
      return other.authorities == epoch.authorities
         and other.randomness == epoch.randomness;
    };

    if (epoch.epoch_index == previous.epoch_index) {
      if (not same_data(previous)) {
        return stale();
      }
    } else if (epoch.epoch_index != previous.epoch_index + 1) {
      return stale();
    }

    for (std::optional<primitives::BlockHash> current = parent_change;
         current.has_value();
         current = changes_.at(*current).parent) {
      const auto &known = changes_.at(*current).epoch;
      if (known.epoch_index > epoch.epoch_index) {
        return stale();
      }
      if (known.epoch_index == epoch.epoch_index and not same_data(known)) {
        return stale();
      }
    }

    changes_.emplace(block.hash,
                     EpochChange{
                         .block = block,
                         .epoch = epoch,
                         .parent = parent_change,
                     });
    SL_DEBUG(logger_, "Block {} announces {}", block, epoch);
    return outcome::success();
  }

  outcome::result<void> EpochTrackerImpl::prune(
      const primitives::BlockHash &finalized_hash) {
    std::unique_lock lock{mutex_};

    if (finalized_hash == root_.hash) {
      return outcome::success();
    }

    auto header_res = block_tree_->getBlockHeader(finalized_hash);
    if (header_res.has_error()) {
      return EpochTrackerError::UNKNOWN_BLOCK;
    }
    const auto &header = header_res.value();
    primitives::BlockInfo finalized{header.number, finalized_hash};

    OUTCOME_TRY(from, findChange(finalized_hash));
    OUTCOME_TRY(slot, getSlot(header));

    auto in_effect = changeInEffect(from, slot);
    if (not in_effect.has_value()) {
      return EpochTrackerError::UNKNOWN_BLOCK;
    }

    std::unordered_set<primitives::BlockHash> retained;
    for (auto current = from;; current = changes_.at(current).parent.value()) {
      retained.emplace(current);
      if (current == *in_effect) {
        break;
      }
    }
    for (const auto &[hash, change] : changes_) {
      if (change.block.number > finalized.number
          and isDescendantOf(change.block, finalized)) {
        retained.emplace(hash);
      }
    }

    auto removed = std::erase_if(changes_, [&](const auto &item) {
      return retained.count(item.first) == 0;
    });
    changes_.at(*in_effect).parent.reset();

    root_ = finalized;
    root_change_ = from;

    SL_VERBOSE(logger_,
               "Finalized {}: {} epoch changes removed, {} retained",
               finalized,
               removed,
               changes_.size());
    return outcome::success();
  }

  primitives::BlockInfo EpochTrackerImpl::root() const {
    std::shared_lock lock{mutex_};
    return root_;
  }

  outcome::result<primitives::BlockHash> EpochTrackerImpl::findChange(
      primitives::BlockHash hash) const {
    while (true) {
      if (hash == root_.hash) {
        return root_change_;
      }
      // changes at or below root are only reachable through the root
      if (auto it = changes_.find(hash);
          it != changes_.end() and it->second.block.number > root_.number) {
        return hash;
      }
      auto header_res = block_tree_->getBlockHeader(hash);
      if (header_res.has_error()) {
        return EpochTrackerError::UNKNOWN_BLOCK;
      }
      const auto &header = header_res.value();
      if (header.number <= root_.number) {
        return EpochTrackerError::UNKNOWN_BLOCK;
      }
      hash = header.parent_hash;
    }
  }

  outcome::result<Epoch> EpochTrackerImpl::resolveEpoch(
      const primitives::BlockHash &from, SlotNumber slot) const {
    auto in_effect = changeInEffect(from, slot);
    if (not in_effect.has_value()) {
      // slot precedes every retained epoch
      return EpochTrackerError::UNKNOWN_BLOCK;
    }
    const auto &epoch = changes_.at(*in_effect).epoch;
    if (slot >= epoch.endSlot()) {
      return epoch.cloneForSlot(slot);
    }
    return epoch;
  }

  std::optional<primitives::BlockHash> EpochTrackerImpl::changeInEffect(
      const primitives::BlockHash &from, SlotNumber slot) const {
    std::optional<primitives::BlockHash> current = from;
    while (current.has_value()) {
      const auto &change = changes_.at(*current);
      if (change.epoch.start_slot <= slot) {
        return current;
      }
      current = change.parent;
    }
    return std::nullopt;
  }

  bool EpochTrackerImpl::isDescendantOf(
      const primitives::BlockInfo &block,
      const primitives::BlockInfo &ancestor) const {
    auto hash = block.hash;
    auto number = block.number;
    while (number > ancestor.number) {
      auto header_res = block_tree_->getBlockHeader(hash);
      if (header_res.has_error()) {
        return false;
      }
      hash = header_res.value().parent_hash;
      number = header_res.value().number - 1;
    }
    return hash == ancestor.hash;
  }

}  // namespace tessera::consensus::babe
