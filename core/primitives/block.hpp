/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "primitives/block_header.hpp"

namespace tessera::primitives {

  using Extrinsic = common::Buffer;
  using BlockBody = std::vector<Extrinsic>;

  /**
   * @brief Block class represents block
   */
  struct Block {
    BlockHeader header;  ///< block header
    BlockBody body{};    ///< extrinsics collection

    bool operator==(const Block &rhs) const {
      return header == rhs.header and body == rhs.body;
    }
  };

}  // namespace tessera::primitives
