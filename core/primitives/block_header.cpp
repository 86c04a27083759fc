/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/block_header.hpp"

namespace tessera::primitives {

  void calculateBlockHash(BlockHeader &header, const crypto::Hasher &hasher) {
    header.hash_opt.reset();
    auto encoded = scale::encode(header).value();
    header.hash_opt = hasher.blake2s_256(encoded);
  }

  BlockHash calculateUnsealedHash(const BlockHeader &header,
                                  const crypto::Hasher &hasher) {
    BOOST_ASSERT_MSG(header.number == 0 or not header.digest.empty(),
                     "Non-genesis block must have at least Seal digest");
    auto unsealed = header;
    unsealed.hash_opt.reset();
    if (not unsealed.digest.empty()) {
      unsealed.digest.pop_back();
    }
    auto encoded = scale::encode(unsealed).value();
    return hasher.blake2s_256(encoded);
  }

}  // namespace tessera::primitives
