/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/timeline/slot_clock.hpp"

#include <gmock/gmock.h>

namespace tessera::consensus {

  class SlotClockMock : public SlotClock {
   public:
    MOCK_METHOD(void, start, (TickHandler), (override));

    MOCK_METHOD(void, stop, (), (override));

    MOCK_METHOD(SlotDuration, slotDuration, (), (const, override));

    MOCK_METHOD(SlotNumber, currentSlot, (), (const, override));

    MOCK_METHOD(SlotNumber, timeToSlot, (TimePoint), (const, override));

    MOCK_METHOD(TimePoint, slotStartTime, (SlotNumber), (const, override));

    MOCK_METHOD(TimePoint, slotFinishTime, (SlotNumber), (const, override));
  };

}  // namespace tessera::consensus
