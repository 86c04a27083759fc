/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "consensus/babe/types/equivocation_proof.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace tessera::runtime {

  /**
   * Api to invoke runtime entries related for Babe algorithm
   */
  class BabeApi {
   public:
    virtual ~BabeApi() = default;

    /// Generates a proof of key ownership for the given authority in the
    /// epoch live at \param block_hash. Proofs of key ownership are
    /// necessary for submitting equivocation reports.
    virtual outcome::result<
        std::optional<consensus::babe::OpaqueKeyOwnershipProof>>
    generate_key_ownership_proof(const primitives::BlockHash &block_hash,
                                 consensus::SlotNumber slot,
                                 primitives::AuthorityId authority_id) = 0;

    /// Submits an unsigned extrinsic to report an equivocation. The caller
    /// must provide the equivocation proof and a key ownership proof
    /// (should be obtained using `generate_key_ownership_proof`).
    virtual outcome::result<void> submit_report_equivocation_unsigned_extrinsic(
        const primitives::BlockHash &block_hash,
        consensus::babe::EquivocationProof equivocation_proof,
        consensus::babe::OpaqueKeyOwnershipProof key_owner_proof) = 0;
  };

}  // namespace tessera::runtime
