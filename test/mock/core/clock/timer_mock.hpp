/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/timer.hpp"

#include <gmock/gmock.h>

namespace tessera::clock {

  class TimerMock : public Timer {
   public:
    MOCK_METHOD(void, expiresAt, (SystemClock::TimePoint), (override));

    MOCK_METHOD(void, cancel, (), (override));

    MOCK_METHOD(void, asyncWait, (Handler), (override));
  };

}  // namespace tessera::clock
