/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "primitives/block.hpp"
#include "primitives/common.hpp"
#include "primitives/digest.hpp"

namespace tessera::authorship {

  /**
   * Create block to further proposal for consensus
   */
  class Proposer {
   public:
    virtual ~Proposer() = default;

    /**
     * Creates block from provided parameters
     * @param parent_block number and hash of parent block
     * @param inherent_digest - chain-specific block auxiliary data
     * @return proposed block without seal or error
     */
    virtual outcome::result<primitives::Block> propose(
        const primitives::BlockInfo &parent_block,
        const primitives::Digest &inherent_digest) = 0;
  };

}  // namespace tessera::authorship
