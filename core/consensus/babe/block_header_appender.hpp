/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/babe_block_validator.hpp"
#include "consensus/babe/fork_weight.hpp"
#include "outcome/outcome.hpp"
#include "primitives/block_header.hpp"

namespace tessera::consensus::babe {

  enum class BlockAdditionError {
    PARENT_NOT_FOUND = 1,
    EXPECTED_EPOCH_CHANGE,
    UNEXPECTED_EPOCH_CHANGE,
  };

  /// Outcome of a successful header import
  struct ImportedHeader {
    primitives::BlockInfo block;
    VerifiedSeal seal;
    ForkWeight weight{};
  };

  /**
   * Adds a new block header to the block storage
   */
  class BlockHeaderAppender {
   public:
    virtual ~BlockHeaderAppender() = default;

    /**
     * Verifies \param block_header, records the epoch it announces and
     * stores it. Nothing is stored if verification fails.
     */
    virtual outcome::result<ImportedHeader> appendHeader(
        primitives::BlockHeader &&block_header) = 0;

    /**
     * Same as appendHeader for a block sealed by this node, except that the
     * header is not stored: the author hands the whole block to the block
     * tree once this succeeds
     */
    virtual outcome::result<ImportedHeader> appendAuthoredHeader(
        const primitives::BlockHeader &block_header) = 0;

    /// Forgets state of blocks which can no longer be imported on
    virtual outcome::result<void> onFinalized(
        const primitives::BlockInfo &finalized) = 0;
  };

}  // namespace tessera::consensus::babe

OUTCOME_HPP_DECLARE_ERROR(tessera::consensus::babe, BlockAdditionError)
