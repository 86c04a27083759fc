/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include <boost/system/error_code.hpp>

#include "clock/clock.hpp"

namespace tessera::clock {

  /**
   * Interface for asynchronous timer
   */
  struct Timer {
    using Handler = std::function<void(const boost::system::error_code &)>;

    virtual ~Timer() = default;

    /**
     * Set an expire time for this timer
     * @param at - timepoint, at which the timer expires
     */
    virtual void expiresAt(SystemClock::TimePoint at) = 0;

    /**
     * Cancel timer. A pending handler is called with operation_aborted.
     */
    virtual void cancel() = 0;

    /**
     * Wait for the timer expiration
     * @param h - handler, which is called, when the timer is expired, or error
     * happens
     */
    virtual void asyncWait(Handler h) = 0;
  };

}  // namespace tessera::clock
