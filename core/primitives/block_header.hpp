/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <boost/assert.hpp>
#include <scale/scale.hpp>

#include "crypto/hasher.hpp"
#include "primitives/common.hpp"
#include "primitives/digest.hpp"

namespace tessera::primitives {

  /**
   * @struct BlockHeader represents header of a block
   */
  struct BlockHeader {
    BlockNumber number{};                 ///< Block number (height)
    BlockHash parent_hash{};              ///< Parent block hash
    common::Hash256 state_root{};         ///< Root of the state after the block
    common::Hash256 extrinsics_root{};    ///< Hash of included extrinsics
    Digest digest{};                      ///< Chain-specific auxiliary data
    std::optional<BlockHash> hash_opt{};  ///< Block hash if calculated

    bool operator==(const BlockHeader &rhs) const {
      return std::tie(parent_hash, number, state_root, extrinsics_root, digest)
          == std::tie(rhs.parent_hash,
                      rhs.number,
                      rhs.state_root,
                      rhs.extrinsics_root,
                      rhs.digest);
    }

    std::optional<BlockInfo> parentInfo() const {
      if (number != 0) {
        return BlockInfo{number - 1, parent_hash};
      }
      return std::nullopt;
    }

    const BlockHash &hash() const {
      BOOST_ASSERT_MSG(hash_opt.has_value(),
                       "Hash must be calculated and saved before that");
      return hash_opt.value();
    }

    BlockInfo blockInfo() const {
      return {number, hash()};
    }
  };

  /**
   * @brief outputs object of type BlockHeader to stream. Every field has a
   * fixed width except the digest, so equal headers always hash equally.
   */
  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const BlockHeader &bh) {
    return s << bh.parent_hash << bh.number << bh.state_root
             << bh.extrinsics_root << bh.digest;
  }

  /**
   * @brief decodes object of type BlockHeader from stream
   */
  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, BlockHeader &bh) {
    return s >> bh.parent_hash >> bh.number >> bh.state_root
        >> bh.extrinsics_root >> bh.digest;
  }

  /// Hashes the encoded header and stores the result in `hash_opt`
  void calculateBlockHash(BlockHeader &header, const crypto::Hasher &hasher);

  /**
   * Hash of the header with its last digest item (the seal) removed. This is
   * the message an author signs.
   */
  BlockHash calculateUnsealedHash(const BlockHeader &header,
                                  const crypto::Hasher &hasher);

}  // namespace tessera::primitives
