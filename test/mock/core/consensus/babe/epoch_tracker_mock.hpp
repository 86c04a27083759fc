/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/epoch_tracker.hpp"

#include <gmock/gmock.h>

namespace tessera::consensus::babe {

  class EpochTrackerMock : public EpochTracker {
   public:
    MOCK_METHOD(outcome::result<Epoch>,
                epochFor,
                (const primitives::BlockHash &),
                (const, override));

    MOCK_METHOD(outcome::result<Epoch>,
                epochForSlot,
                (const primitives::BlockHash &, SlotNumber),
                (const, override));

    MOCK_METHOD(outcome::result<void>,
                importEpochChange,
                (const primitives::BlockInfo &,
                 const primitives::BlockHash &,
                 const Epoch &),
                (override));

    MOCK_METHOD(outcome::result<void>,
                prune,
                (const primitives::BlockHash &),
                (override));

    MOCK_METHOD(primitives::BlockInfo, root, (), (const, override));
  };

}  // namespace tessera::consensus::babe
