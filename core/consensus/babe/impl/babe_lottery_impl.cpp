/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/babe_lottery_impl.hpp"

#include <boost/assert.hpp>

#include "common/int_serialization.hpp"
#include "consensus/babe/impl/prepare_vrf_message.hpp"
#include "consensus/babe/impl/threshold_util.hpp"
#include "crypto/hasher.hpp"
#include "crypto/key_store.hpp"
#include "crypto/vrf_provider.hpp"

namespace tessera::consensus::babe {

  BabeLotteryImpl::BabeLotteryImpl(
      std::shared_ptr<crypto::KeyStore> key_store,
      std::shared_ptr<crypto::VRFProvider> vrf_provider,
      std::shared_ptr<crypto::Hasher> hasher)
      : logger_(log::createLogger("BabeLottery", "babe_lottery")),
        key_store_(std::move(key_store)),
        vrf_provider_(std::move(vrf_provider)),
        hasher_(std::move(hasher)) {
    BOOST_ASSERT(key_store_);
    BOOST_ASSERT(vrf_provider_);
    BOOST_ASSERT(hasher_);
  }

  outcome::result<crypto::VRFOutput> BabeLotteryImpl::compute(
      const primitives::AuthorityId &key,
      const Randomness &randomness,
      EpochNumber epoch,
      SlotNumber slot) const {
    auto message = prepareVrfMessage(randomness, slot, epoch);
    OUTCOME_TRY(output, key_store_->vrfSign(key, message, crypto::kMaxThreshold));
    if (not output.has_value()) {
      // Only an output equal to the maximal value is rejected
      return crypto::KeyStoreError::SIGNING_FAILED;
    }
    return output.value();
  }

  bool BabeLotteryImpl::verify(const primitives::AuthorityId &public_key,
                               const Randomness &randomness,
                               EpochNumber epoch,
                               SlotNumber slot,
                               const crypto::VRFOutput &output) const {
    return checkPrimary(
               public_key, randomness, epoch, slot, output, crypto::kMaxThreshold)
        .is_valid;
  }

  crypto::VRFVerifyOutput BabeLotteryImpl::checkPrimary(
      const primitives::AuthorityId &public_key,
      const Randomness &randomness,
      EpochNumber epoch,
      SlotNumber slot,
      const crypto::VRFOutput &output,
      const Threshold &threshold) const {
    auto message = prepareVrfMessage(randomness, slot, epoch);
    return vrf_provider_->verify(message, output, public_key, threshold);
  }

  Threshold BabeLotteryImpl::threshold(
      const Epoch &epoch, primitives::AuthorityIndex authority_index) const {
    return calculateThreshold(
        epoch.config.leadership_rate, epoch.authorities, authority_index);
  }

  primitives::AuthorityIndex BabeLotteryImpl::secondarySlotAuthor(
      SlotNumber slot,
      size_t authorities_count,
      const Randomness &randomness) const {
    BOOST_ASSERT(authorities_count > 0);
    common::Buffer seed;
    seed.put(randomness).put(common::uint64_to_le_bytes(slot));
    auto rand = common::be_bytes_to_uint256(hasher_->blake2s_256(seed));
    return static_cast<primitives::AuthorityIndex>(rand % authorities_count);
  }

  outcome::result<std::optional<SlotClaim>> BabeLotteryImpl::getSlotLeadership(
      const Epoch &epoch,
      SlotNumber slot,
      primitives::AuthorityIndex authority_index) const {
    BOOST_ASSERT(authority_index < epoch.authorities.size());
    const auto &key = epoch.authorities[authority_index].id;

    auto message = prepareVrfMessage(epoch.randomness, slot, epoch.epoch_index);
    auto threshold = this->threshold(epoch, authority_index);
    OUTCOME_TRY(primary_output, key_store_->vrfSign(key, message, threshold));

    if (primary_output.has_value()) {
      SL_TRACE(logger_, "Primary leadership in slot {}", slot);
      return SlotClaim{
          .slot = slot,
          .slot_type = SlotType::Primary,
          .authority_index = authority_index,
          .authority_id = key,
          .vrf_output = primary_output.value(),
      };
    }

    if (epoch.config.allowed_slots == AllowedSlots::PrimaryOnly) {
      // Secondary is not allowed
      return std::nullopt;
    }

    auto leader_index =
        secondarySlotAuthor(slot, epoch.authorities.size(), epoch.randomness);
    if (leader_index != authority_index) {
      // Author is not a secondary leader
      return std::nullopt;
    }

    if (epoch.config.allowed_slots == AllowedSlots::PrimaryAndSecondaryVRF) {
      OUTCOME_TRY(vrf_output,
                  compute(key, epoch.randomness, epoch.epoch_index, slot));
      SL_TRACE(logger_, "SecondaryVRF leadership in slot {}", slot);
      return SlotClaim{
          .slot = slot,
          .slot_type = SlotType::SecondaryVRF,
          .authority_index = authority_index,
          .authority_id = key,
          .vrf_output = vrf_output,
      };
    }

    SL_TRACE(logger_, "SecondaryPlain leadership in slot {}", slot);
    return SlotClaim{
        .slot = slot,
        .slot_type = SlotType::SecondaryPlain,
        .authority_index = authority_index,
        .authority_id = key,
        .vrf_output = {},
    };
  }

}  // namespace tessera::consensus::babe
