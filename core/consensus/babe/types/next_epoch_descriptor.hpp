/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "consensus/babe/types/babe_configuration.hpp"

namespace tessera::consensus::babe {

  /// Kind tag of a BABE consensus digest message
  enum class ConsensusLogKind : uint8_t {
    NextEpochData = 1,
    NextConfigData = 3,
  };

  /**
   * Data of the next epoch announced by the runtime in the first block of
   * the current epoch
   */
  struct NextEpochDescriptor {
    /// The authorities actual for corresponding epoch
    primitives::AuthorityList authorities;

    /// The value of randomness to use for the slot-assignment
    Randomness randomness;

    bool operator==(const NextEpochDescriptor &other) const = default;

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const NextEpochDescriptor &ned) {
      return s << ned.authorities << ned.randomness;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, NextEpochDescriptor &ned) {
      return s >> ned.authorities >> ned.randomness;
    }
  };

}  // namespace tessera::consensus::babe
