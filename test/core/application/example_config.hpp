/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sstream>
#include <string_view>

#include "application/impl/tessera_config.hpp"

namespace test::application {

  inline constexpr std::string_view kExampleConfigJson = R"({
  "babe": {
    "slot_duration_ms": 6000,
    "epoch_length": 600,
    "leadership_rate": [1, 4],
    "allowed_slots": "PrimaryAndSecondaryVRF",
    "randomness": "0x0101010101010101010101010101010101010101010101010101010101010101",
    "genesis_slot": 1000,
    "authorities": [
      {
        "id": "0x0202020202020202020202020202020202020202020202020202020202020202",
        "weight": 1
      },
      {
        "id": "0x0303030303030303030303030303030303030303030303030303030303030303",
        "weight": 3
      }
    ]
  },
  "equivocation": {
    "slot_horizon": 64
  },
  "log": ["babe=debug", "timeline=trace"]
})";

  inline std::stringstream readJSONConfig() {
    return std::stringstream{std::string{kExampleConfigJson}};
  }

  /// Config equal to the one in kExampleConfigJson
  inline tessera::application::TesseraConfig getExampleConfig() {
    using namespace tessera::consensus;
    tessera::application::TesseraConfig c;
    c.babe.slot_duration = SlotDuration{6000};
    c.babe.epoch_length = 600;
    c.babe.epoch_config = {
        .leadership_rate = {1, 4},
        .allowed_slots = babe::AllowedSlots::PrimaryAndSecondaryVRF,
    };
    c.babe.randomness.fill(1);
    c.babe.authorities.resize(2);
    c.babe.authorities[0].id.fill(2);
    c.babe.authorities[0].weight = 1;
    c.babe.authorities[1].id.fill(3);
    c.babe.authorities[1].weight = 3;
    c.genesis_slot = 1000;
    c.equivocation_slot_horizon = 64;
    c.log = {"babe=debug", "timeline=trace"};
    return c;
  }

}  // namespace test::application
