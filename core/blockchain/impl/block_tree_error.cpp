/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/block_tree_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tessera::blockchain, BlockTreeError, e) {
  using E = tessera::blockchain::BlockTreeError;
  switch (e) {
    case E::NO_PARENT:
      return "block, which should have been added, has no known parent";
    case E::BLOCK_EXISTS:
      return "block, which should have been inserted, already exists in the "
             "tree";
    case E::HEADER_NOT_FOUND:
      return "the requested block header is not found in block storage";
  }
  return "unknown error";
}
