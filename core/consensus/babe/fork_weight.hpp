/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <limits>

#include "consensus/babe/types/babe_block_header.hpp"

namespace tessera::consensus::babe {

  /// Accumulated weight of a chain, comparable between forks
  using ForkWeight = uint32_t;

  /// Weight a block adds to its chain: primary blocks count twice
  constexpr ForkWeight weightIncrement(SlotType slot_type) {
    return slot_type == SlotType::Primary ? 2 : 1;
  }

  /// Weight of a chain after appending a block; saturates at the maximum
  constexpr ForkWeight cumulativeWeight(ForkWeight parent_weight,
                                        ForkWeight increment) {
    constexpr auto kMax = std::numeric_limits<ForkWeight>::max();
    return parent_weight > kMax - increment ? kMax
                                            : parent_weight + increment;
  }

}  // namespace tessera::consensus::babe
