/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "consensus/babe/types/equivocation_proof.hpp"

namespace tessera::consensus::babe {

  /**
   * Watches authored headers for an authority producing several blocks in
   * one slot
   */
  class EquivocationDetector {
   public:
    virtual ~EquivocationDetector() = default;

    /**
     * Remembers \param header authored by \param authority_id in \param slot
     * @return proof made of the first header seen for the slot and \param
     * header, if the latter was not seen before and differs from the first
     */
    virtual std::optional<EquivocationProof> observe(
        const primitives::AuthorityId &authority_id,
        SlotNumber slot,
        const primitives::BlockHeader &header) = 0;
  };

}  // namespace tessera::consensus::babe
