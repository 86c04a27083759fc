/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "common/buffer.hpp"
#include "common/int_serialization.hpp"
#include "consensus/timeline/types.hpp"

namespace tessera::consensus::babe {

  constexpr std::string_view kVrfMessageLabel = "tessera-babe";

  /**
   * Builds the message VRF is evaluated on for a slot:
   * label || randomness || epoch (u64 le) || slot (u64 le).
   * All parts have fixed width, so distinct (epoch, slot) pairs never
   * produce the same message.
   */
  inline common::Buffer prepareVrfMessage(const Randomness &randomness,
                                          SlotNumber slot,
                                          EpochNumber epoch) {
    common::Buffer message;
    message.reserve(kVrfMessageLabel.size() + Randomness::size() + 16);
    message.put(kVrfMessageLabel)
        .put(randomness)
        .put(common::uint64_to_le_bytes(epoch))
        .put(common::uint64_to_le_bytes(slot));
    return message;
  }

}  // namespace tessera::consensus::babe
