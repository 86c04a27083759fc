/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "consensus/babe/types/babe_configuration.hpp"
#include "consensus/babe/types/slot_leadership.hpp"
#include "consensus/timeline/types.hpp"
#include "crypto/sr25519_types.hpp"
#include "outcome/outcome.hpp"

namespace tessera::consensus::babe {

  /// Leadership oracle: VRF evaluation and eligibility rules for slots
  class BabeLottery {
   public:
    virtual ~BabeLottery() = default;

    /// Evaluates VRF of the local key \param key for the slot
    /// @return output or KeyStoreError::KEY_NOT_AVAILABLE
    virtual outcome::result<crypto::VRFOutput> compute(
        const primitives::AuthorityId &key,
        const Randomness &randomness,
        EpochNumber epoch,
        SlotNumber slot) const = 0;

    /// Checks that \param output is a valid VRF of \param public_key for the
    /// slot. Any mismatch yields plain false.
    virtual bool verify(const primitives::AuthorityId &public_key,
                        const Randomness &randomness,
                        EpochNumber epoch,
                        SlotNumber slot,
                        const crypto::VRFOutput &output) const = 0;

    /// Same as verify, additionally telling whether the output is below
    /// \param threshold
    virtual crypto::VRFVerifyOutput checkPrimary(
        const primitives::AuthorityId &public_key,
        const Randomness &randomness,
        EpochNumber epoch,
        SlotNumber slot,
        const crypto::VRFOutput &output,
        const Threshold &threshold) const = 0;

    /// Primary slot threshold of an authority in \param epoch
    virtual Threshold threshold(
        const Epoch &epoch, primitives::AuthorityIndex authority_index) const = 0;

    /// Index of the only authority allowed to claim \param slot as secondary
    virtual primitives::AuthorityIndex secondarySlotAuthor(
        SlotNumber slot,
        size_t authorities_count,
        const Randomness &randomness) const = 0;

    /// Check slot leadership of the local authority
    /// @param epoch the slot belongs to
    /// @param authority_index position of the local key in epoch authorities
    /// @return claim, none if not a leader, or key store error
    virtual outcome::result<std::optional<SlotClaim>> getSlotLeadership(
        const Epoch &epoch,
        SlotNumber slot,
        primitives::AuthorityIndex authority_index) const = 0;
  };

}  // namespace tessera::consensus::babe
