/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/babe_block_validator_impl.hpp"

#include "consensus/babe/babe_lottery.hpp"
#include "consensus/babe/epoch_tracker.hpp"
#include "consensus/babe/impl/babe_digests_util.hpp"
#include "consensus/babe/types/seal.hpp"
#include "crypto/hasher.hpp"
#include "crypto/sr25519_provider.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tessera::consensus::babe,
                            BabeBlockValidator::ValidationError,
                            e) {
  using E = tessera::consensus::babe::BabeBlockValidator::ValidationError;
  switch (e) {
    case E::NO_DIGEST:
      return "block has no valid BABE header or seal digest";
    case E::SLOT_NOT_INCREASING:
      return "slot of block is not greater than slot of its parent";
    case E::EPOCH_MISMATCH:
      return "epoch of secondary plain header differs from the epoch of its "
             "slot";
    case E::AUTHOR_NOT_IN_SET:
      return "author of block is not active validator";
    case E::SECONDARY_SLOT_ASSIGNMENTS_DISABLED:
      return "Secondary slot assignments are disabled for the current epoch.";
    case E::BAD_VRF_PROOF:
      return "VRF value and output are invalid";
    case E::INELIGIBLE_CLAIM:
      return "author of block is not a leader of the slot";
    case E::BAD_SIGNATURE:
      return "SR25519 signature, which is in BABE header, is invalid";
  }
  return "unknown error";
}

namespace tessera::consensus::babe {

  BabeBlockValidatorImpl::BabeBlockValidatorImpl(
      std::shared_ptr<EpochTracker> epoch_tracker,
      std::shared_ptr<BabeLottery> lottery,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<crypto::Sr25519Provider> sr25519_provider)
      : log_(log::createLogger("BabeBlockValidator", "block_validator")),
        epoch_tracker_(std::move(epoch_tracker)),
        lottery_(std::move(lottery)),
        hasher_(std::move(hasher)),
        sr25519_provider_(std::move(sr25519_provider)) {
    BOOST_ASSERT(epoch_tracker_);
    BOOST_ASSERT(lottery_);
    BOOST_ASSERT(hasher_);
    BOOST_ASSERT(sr25519_provider_);
  }

  outcome::result<VerifiedSeal> BabeBlockValidatorImpl::validateHeader(
      const primitives::BlockHeader &header,
      const primitives::BlockHeader &parent_header) const {
    // get BABE-specific digests, which must be inside this block
    auto babe_header_res = getBabeBlockHeader(header);
    if (babe_header_res.has_error()) {
      SL_VERBOSE(log_,
                 "Block #{} has no BABE header: {}",
                 header.number,
                 babe_header_res.error().message());
      return ValidationError::NO_DIGEST;
    }
    const auto &babe_header = babe_header_res.value();

    auto seal_res = getSeal(header);
    if (seal_res.has_error()) {
      SL_VERBOSE(log_,
                 "Block #{} has no seal: {}",
                 header.number,
                 seal_res.error().message());
      return ValidationError::NO_DIGEST;
    }
    const auto &seal = seal_res.value();

    auto slot = babe_header.slot_number;

    // genesis has no slot
    if (parent_header.number != 0) {
      OUTCOME_TRY(parent_slot, getSlot(parent_header));
      if (slot <= parent_slot) {
        SL_VERBOSE(log_,
                   "Block #{} in slot {} is not after its parent slot {}",
                   header.number,
                   slot,
                   parent_slot);
        return ValidationError::SLOT_NOT_INCREASING;
      }
    }

    OUTCOME_TRY(epoch, epoch_tracker_->epochForSlot(header.parent_hash, slot));

    SL_TRACE(log_,
             "Validating header #{} ({} in slot {}, {}, authority #{})",
             header.number,
             to_string(babe_header.slot_assignment_type),
             slot,
             epoch,
             babe_header.authority_index);

    if (babe_header.authority_index >= epoch.authorities.size()) {
      SL_VERBOSE(log_,
                 "Block #{} is invalid because validator index out of bound",
                 header.number);
      return ValidationError::AUTHOR_NOT_IN_SET;
    }
    const auto &authority_id =
        epoch.authorities[babe_header.authority_index].id;

    OUTCOME_TRY(verifyClaim(header, babe_header, epoch));

    // signature in seal of the header must be valid
    if (not verifySignature(header, seal, authority_id)) {
      return ValidationError::BAD_SIGNATURE;
    }

    SL_DEBUG(log_,
             "Block #{} validated, signed by authority: {}",
             header.number,
             authority_id);

    return VerifiedSeal{
        .authority_index = babe_header.authority_index,
        .authority_id = authority_id,
        .slot = slot,
        .slot_type = babe_header.slot_assignment_type,
        .epoch_index = babe_header.epoch_index,
        .vrf_output = babe_header.vrf_output,
    };
  }

  outcome::result<void> BabeBlockValidatorImpl::verifyClaim(
      const primitives::BlockHeader &header,
      const BabeBlockHeader &babe_header,
      const Epoch &epoch) const {
    const auto slot_type = babe_header.slot_assignment_type;
    const auto &allowed_slots = epoch.config.allowed_slots;

    if (babe_header.isProducedInSecondarySlot()) {
      bool plain_and_allowed =
          allowed_slots == AllowedSlots::PrimaryAndSecondaryPlain
          and slot_type == SlotType::SecondaryPlain;
      bool vrf_and_allowed =
          allowed_slots == AllowedSlots::PrimaryAndSecondaryVRF
          and slot_type == SlotType::SecondaryVRF;
      if (not plain_and_allowed and not vrf_and_allowed) {
        SL_WARN(log_,
                "Block #{} produced in {} slot, but current "
                "configuration allows only {}",
                header.number,
                to_string(slot_type),
                to_string(allowed_slots));
        return ValidationError::SECONDARY_SLOT_ASSIGNMENTS_DISABLED;
      }
    }

    if (babe_header.epoch_index != epoch.epoch_index) {
      SL_VERBOSE(log_,
                 "Block #{} claims epoch {}, but slot {} belongs to {}",
                 header.number,
                 babe_header.epoch_index,
                 babe_header.slot_number,
                 epoch);
      // VRF output is bound to the epoch of the slot
      return babe_header.needVRFCheck() ? ValidationError::BAD_VRF_PROOF
                                        : ValidationError::EPOCH_MISMATCH;
    }

    const auto authority_index = babe_header.authority_index;
    const auto &authority_id = epoch.authorities[authority_index].id;

    // VRF must prove that the peer is the leader of the slot
    if (babe_header.needVRFCheck()) {
      auto threshold = slot_type == SlotType::Primary
                         ? lottery_->threshold(epoch, authority_index)
                         : crypto::kMaxThreshold;
      auto verify_res = lottery_->checkPrimary(authority_id,
                                               epoch.randomness,
                                               epoch.epoch_index,
                                               babe_header.slot_number,
                                               babe_header.vrf_output,
                                               threshold);
      if (not verify_res.is_valid) {
        SL_VERBOSE(log_, "VRF proof in block #{} is not valid", header.number);
        return ValidationError::BAD_VRF_PROOF;
      }
      if (slot_type == SlotType::Primary and not verify_res.is_less) {
        SL_VERBOSE(log_,
                   "VRF value in block #{} is not less than the threshold",
                   header.number);
        return ValidationError::INELIGIBLE_CLAIM;
      }
    }

    if (babe_header.isProducedInSecondarySlot()) {
      auto expected = lottery_->secondarySlotAuthor(babe_header.slot_number,
                                                    epoch.authorities.size(),
                                                    epoch.randomness);
      if (expected != authority_index) {
        SL_VERBOSE(log_,
                   "Secondary slot {} belongs to authority #{}, not #{}",
                   babe_header.slot_number,
                   expected,
                   authority_index);
        return ValidationError::INELIGIBLE_CLAIM;
      }
    }

    return outcome::success();
  }

  bool BabeBlockValidatorImpl::verifySignature(
      const primitives::BlockHeader &header,
      const Seal &seal,
      const primitives::AuthorityId &public_key) const {
    auto signed_hash = primitives::calculateUnsealedHash(header, *hasher_);

    // secondly, use verify function to check the signature
    auto res =
        sr25519_provider_->verify(seal.signature, signed_hash, public_key);
    return res and res.value();
  }

}  // namespace tessera::consensus::babe
