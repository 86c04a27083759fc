/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <scale/scale.hpp>

#include "consensus/timeline/types.hpp"
#include "crypto/sr25519_types.hpp"
#include "primitives/authority.hpp"

namespace tessera::consensus::babe {

  /// Kind of slot leadership a block was authored under
  enum class SlotType : uint8_t {
    /// Primary slot leader, elected by VRF below threshold
    Primary = 1,
    /// Secondary slot leader without VRF output
    SecondaryPlain = 2,
    /// Secondary slot leader carrying a VRF output
    SecondaryVRF = 3,
  };

  inline std::string_view to_string(SlotType type) {
    switch (type) {
      case SlotType::Primary:
        return "Primary";
      case SlotType::SecondaryPlain:
        return "SecondaryPlain";
      case SlotType::SecondaryVRF:
        return "SecondaryVRF";
    }
    return "Unknown";
  }

  /**
   * Authorship claim carried by a block in its pre-runtime digest. Encoded
   * with a fixed width regardless of slot type: VRF bytes are zero for
   * SecondaryPlain.
   */
  struct BabeBlockHeader {
    SlotType slot_assignment_type{};

    /// authority index of the producer
    primitives::AuthorityIndex authority_index{};

    /// slot, in which the block was produced
    SlotNumber slot_number{};

    /// epoch the producer believed the slot to belong to
    EpochNumber epoch_index{};

    /// output of VRF function
    crypto::VRFOutput vrf_output{};

    bool operator==(const BabeBlockHeader &other) const = default;

    bool needVRFCheck() const {
      return slot_assignment_type == SlotType::Primary
          or slot_assignment_type == SlotType::SecondaryVRF;
    }

    bool isProducedInSecondarySlot() const {
      return slot_assignment_type == SlotType::SecondaryPlain
          or slot_assignment_type == SlotType::SecondaryVRF;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const BabeBlockHeader &bh) {
      return s << static_cast<uint8_t>(bh.slot_assignment_type)
               << bh.authority_index << bh.slot_number << bh.epoch_index
               << bh.vrf_output;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, BabeBlockHeader &bh) {
      uint8_t slot_type = 0;
      s >> slot_type >> bh.authority_index >> bh.slot_number >> bh.epoch_index
          >> bh.vrf_output;
      bh.slot_assignment_type = static_cast<SlotType>(slot_type);
      return s;
    }
  };

}  // namespace tessera::consensus::babe
