/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "consensus/timeline/types.hpp"
#include "primitives/authority.hpp"
#include "primitives/block_header.hpp"

namespace tessera::consensus::babe {

  /// Proof that an authority key belonged to the set at the time of the
  /// offence, opaque to the consensus
  using OpaqueKeyOwnershipProof = common::Buffer;

  /**
   * Represents an equivocation proof. An equivocation happens when a
   * validator produces more than one block on the same slot. The proof of
   * equivocation are the given distinct headers that were signed by the
   * validator and which include the slot number.
   */
  struct EquivocationProof {
    /// Returns the authority id of the equivocator.
    primitives::AuthorityId offender;
    /// The slot at which the equivocation happened.
    SlotNumber slot{};
    /// The first header involved in the equivocation.
    primitives::BlockHeader first_header;
    /// The second header involved in the equivocation.
    primitives::BlockHeader second_header;

    bool operator==(const EquivocationProof &other) const = default;

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const EquivocationProof &proof) {
      return s << proof.offender << proof.slot << proof.first_header
               << proof.second_header;
    }
  };

}  // namespace tessera::consensus::babe
