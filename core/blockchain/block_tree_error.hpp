/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace tessera::blockchain {
  /**
   * Errors of the block tree are here, so that other modules can use them, for
   * example, to compare a received error with those
   */
  enum class BlockTreeError {
    NO_PARENT = 1,
    BLOCK_EXISTS,
    // block header is not found in block storage
    HEADER_NOT_FOUND,
  };
}  // namespace tessera::blockchain

OUTCOME_HPP_DECLARE_ERROR(tessera::blockchain, BlockTreeError)
