/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/types/babe_block_header.hpp"
#include "outcome/outcome.hpp"
#include "primitives/block_header.hpp"

namespace tessera::consensus::babe {

  /// Authorship claim of a header which passed verification
  struct VerifiedSeal {
    primitives::AuthorityIndex authority_index{};
    primitives::AuthorityId authority_id;
    SlotNumber slot{};
    SlotType slot_type{};
    EpochNumber epoch_index{};
    crypto::VRFOutput vrf_output{};

    bool operator==(const VerifiedSeal &other) const = default;
  };

  class BabeBlockValidator {
   public:
    enum class ValidationError {
      NO_DIGEST = 1,
      SLOT_NOT_INCREASING,
      EPOCH_MISMATCH,
      AUTHOR_NOT_IN_SET,
      SECONDARY_SLOT_ASSIGNMENTS_DISABLED,
      BAD_VRF_PROOF,
      INELIGIBLE_CLAIM,
      BAD_SIGNATURE,
    };

    virtual ~BabeBlockValidator() = default;

    /**
     * Checks authorship claim of \param header built on top of \param
     * parent_header. Does not modify any state.
     * @return verified claim or ValidationError, EpochTrackerError
     */
    virtual outcome::result<VerifiedSeal> validateHeader(
        const primitives::BlockHeader &header,
        const primitives::BlockHeader &parent_header) const = 0;
  };

}  // namespace tessera::consensus::babe

OUTCOME_HPP_DECLARE_ERROR(tessera::consensus::babe,
                          BabeBlockValidator::ValidationError)
