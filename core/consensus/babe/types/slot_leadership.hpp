/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/types/babe_block_header.hpp"

namespace tessera::consensus::babe {

  /// Local decision to author a block in a slot
  struct SlotClaim {
    SlotNumber slot{};
    SlotType slot_type{};
    primitives::AuthorityIndex authority_index{};
    primitives::AuthorityId authority_id;
    crypto::VRFOutput vrf_output{};

    bool operator==(const SlotClaim &other) const = default;
  };

}  // namespace tessera::consensus::babe
