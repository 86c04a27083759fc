/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <utility>

#include "consensus/timeline/types.hpp"
#include "primitives/authority.hpp"

namespace tessera::consensus::babe {

  enum class AllowedSlots : uint8_t {
    PrimaryOnly,
    PrimaryAndSecondaryPlain,
    PrimaryAndSecondaryVRF
  };

  inline std::string_view to_string(AllowedSlots s) {
    switch (s) {
      case AllowedSlots::PrimaryOnly:
        return "Primary only";
      case AllowedSlots::PrimaryAndSecondaryPlain:
        return "Primary and Secondary Plain";
      case AllowedSlots::PrimaryAndSecondaryVRF:
        return "Primary and Secondary VRF";
    }
    return "Unknown";
  }

  /// Parameters of slot assignment which may change from epoch to epoch
  struct EpochConfiguration {
    /// A constant value that is used in the threshold calculation formula.
    /// Expressed as a rational where the first member of the pair is the
    /// numerator and the second is the denominator. The rational should
    /// represent a value in (0, 1].
    /// In the threshold formula calculation, `1 - leadership_rate` represents
    /// the probability of a slot being empty.
    std::pair<uint64_t, uint64_t> leadership_rate{};

    /// Type of allowed slots.
    AllowedSlots allowed_slots{};

    bool operator==(const EpochConfiguration &other) const = default;

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const EpochConfiguration &config) {
      return s << config.leadership_rate.first << config.leadership_rate.second
               << static_cast<uint8_t>(config.allowed_slots);
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, EpochConfiguration &config) {
      uint8_t allowed_slots = 0;
      s >> config.leadership_rate.first >> config.leadership_rate.second
          >> allowed_slots;
      config.allowed_slots = static_cast<AllowedSlots>(allowed_slots);
      return s;
    }
  };

  /// Configuration data used by the BABE consensus engine at genesis.
  struct BabeConfiguration {
    /// The slot duration. Must be permanent.
    SlotDuration slot_duration{};

    /// Number of slots in an epoch. Must be permanent.
    EpochLength epoch_length{};

    /// Threshold and slot kinds of the genesis epoch
    EpochConfiguration epoch_config{};

    /// The authorities of the genesis epoch
    primitives::AuthorityList authorities;

    /// The randomness of the genesis epoch
    Randomness randomness;

    bool operator==(const BabeConfiguration &other) const = default;
  };

  /**
   * Epoch descriptor: a contiguous run of slots sharing one authority set and
   * one randomness value
   */
  struct Epoch {
    EpochNumber epoch_index{};
    SlotNumber start_slot{};
    EpochLength duration{};
    primitives::AuthorityList authorities;
    Randomness randomness;
    EpochConfiguration config;

    bool operator==(const Epoch &other) const = default;

    /// First slot after this epoch
    SlotNumber endSlot() const {
      return start_slot + duration;
    }

    bool containsSlot(SlotNumber slot) const {
      return slot >= start_slot and slot < endSlot();
    }

    /**
     * Epoch following this one when no data was announced for it: timings
     * advance, authorities and randomness carry over
     */
    Epoch cloneForSlot(SlotNumber slot) const {
      auto skipped = (slot - start_slot) / duration;
      auto epoch = *this;
      epoch.epoch_index += skipped;
      epoch.start_slot += skipped * duration;
      return epoch;
    }
  };

  /// Genesis epoch described by the chain configuration
  inline Epoch genesisEpoch(const BabeConfiguration &config,
                            SlotNumber genesis_slot) {
    return Epoch{
        .epoch_index = 0,
        .start_slot = genesis_slot,
        .duration = config.epoch_length,
        .authorities = config.authorities,
        .randomness = config.randomness,
        .config = config.epoch_config,
    };
  }

}  // namespace tessera::consensus::babe

template <>
struct fmt::formatter<tessera::consensus::babe::Epoch> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const tessera::consensus::babe::Epoch &epoch,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(),
                          "epoch {} [{}..{})",
                          epoch.epoch_index,
                          epoch.start_slot,
                          epoch.endSlot());
  }
};
