/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace tessera::clock {

  template <typename ClockType>
  class ClockImpl : public Clock<ClockType> {
   public:
    typename Clock<ClockType>::TimePoint now() const override;

    uint64_t nowMillis() const override;
  };

  using SystemClockImpl = ClockImpl<std::chrono::system_clock>;

}  // namespace tessera::clock
