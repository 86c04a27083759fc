/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "consensus/babe/types/babe_block_header.hpp"
#include "consensus/babe/types/next_epoch_descriptor.hpp"
#include "consensus/babe/types/seal.hpp"
#include "consensus/timeline/types.hpp"
#include "outcome/outcome.hpp"
#include "primitives/block_header.hpp"

namespace tessera::consensus::babe {

  enum class DigestError {
    REQUIRED_DIGESTS_NOT_FOUND = 1,
    NO_TRAILING_SEAL_DIGEST,
    GENESIS_BLOCK_CAN_NOT_HAVE_DIGESTS,
    INVALID_SLOT_TYPE,
    MULTIPLE_PRE_DIGESTS,
  };

  outcome::result<SlotNumber> getSlot(const primitives::BlockHeader &header);

  /// Decodes the single BABE pre-runtime digest of a non-genesis header
  outcome::result<BabeBlockHeader> getBabeBlockHeader(
      const primitives::BlockHeader &block_header);

  /// Decodes the seal, which must be the last digest item
  outcome::result<Seal> getSeal(const primitives::BlockHeader &block_header);

  /// Next epoch announcement, if the header carries one
  outcome::result<std::optional<NextEpochDescriptor>> getNextEpochDigest(
      const primitives::BlockHeader &block_header);

  /// Next epoch configuration change, if the header carries one
  outcome::result<std::optional<EpochConfiguration>> getNextConfigDigest(
      const primitives::BlockHeader &block_header);

  primitives::DigestItem makePreDigest(const BabeBlockHeader &babe_header);

  primitives::DigestItem makeSealDigest(const Seal &seal);

  primitives::DigestItem makeNextEpochDigest(
      const NextEpochDescriptor &descriptor);

  primitives::DigestItem makeNextConfigDigest(
      const EpochConfiguration &config);

}  // namespace tessera::consensus::babe

OUTCOME_HPP_DECLARE_ERROR(tessera::consensus::babe, DigestError)
