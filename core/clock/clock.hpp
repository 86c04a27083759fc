/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace tessera::clock {

  /**
   * An interface for a clock
   * @tparam clock type is an underlying clock type, such as std::steady_clock
   */
  template <typename ClockType>
  class Clock {
   public:
    /**
     * Difference between two time points
     */
    using Duration = typename ClockType::duration;

    /**
     * A moment in time
     */
    using TimePoint = typename ClockType::time_point;

    virtual ~Clock() = default;

    /**
     * @return a time point representing the current time
     */
    virtual TimePoint now() const = 0;

    /**
     * @return milliseconds since the clock's epoch
     */
    virtual uint64_t nowMillis() const = 0;
  };

  /**
   * SystemClock alias over Clock. Slots are measured against wall time, so
   * this is the clock consensus uses.
   */
  using SystemClock = Clock<std::chrono::system_clock>;

}  // namespace tessera::clock
