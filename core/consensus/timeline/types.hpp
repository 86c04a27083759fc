/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "clock/clock.hpp"
#include "crypto/sr25519_types.hpp"

namespace tessera::consensus {

  using Clock = clock::SystemClock;

  /// Consensus uses system clock's time points
  using TimePoint = Clock::TimePoint;

  /// slot number of the block production
  using SlotNumber = uint64_t;

  /// duration of single slot
  using SlotDuration = std::chrono::milliseconds;

  /// number of the epoch in the block production
  using EpochNumber = uint64_t;

  /// number of slots in a single epoch
  using EpochLength = SlotNumber;

  /// threshold, which must not be exceeded for the party to be a slot leader
  using Threshold = crypto::VRFThreshold;

  /// random value, which serves as a seed for VRF slot leadership selection
  using Randomness = common::Blob<crypto::constants::sr25519::vrf::OUTPUT_SIZE>;

}  // namespace tessera::consensus
