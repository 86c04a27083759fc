/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "primitives/block.hpp"
#include "primitives/common.hpp"

namespace tessera::blockchain {

  /**
   * Read and append access to the chain storage the consensus works on top
   * of. Storage layout, fork choice and finalization live behind it.
   */
  class BlockTree {
   public:
    virtual ~BlockTree() = default;

    /**
     * @returns hash of genesis block
     */
    virtual const primitives::BlockHash &getGenesisBlockHash() const = 0;

    /**
     * Get block header by provided block id
     * @param block_hash hash of the block header we are looking for
     * @return result containing block header if it exists, error otherwise
     */
    virtual outcome::result<primitives::BlockHeader> getBlockHeader(
        const primitives::BlockHash &block_hash) const = 0;

    /**
     * Adds a new block to the tree
     * @param block to be added
     * @return nothing or error; if error happens, no changes in the tree are
     * made
     *
     * @note if block, which is specified in PARENT_HASH field of (\param
     * block) is not in our local storage, corresponding error is returned.
     */
    virtual outcome::result<void> addBlock(const primitives::Block &block) = 0;

    /**
     * Adds header of a block received from the network
     */
    virtual outcome::result<void> addBlockHeader(
        const primitives::BlockHeader &header) = 0;

    /**
     * Get the most recent block of the best chain
     * @return block info of the best block
     */
    virtual primitives::BlockInfo bestBlock() const = 0;

    /**
     * Get the last finalized block
     * @return hash of the block
     */
    virtual primitives::BlockInfo getLastFinalized() const = 0;
  };

}  // namespace tessera::blockchain
