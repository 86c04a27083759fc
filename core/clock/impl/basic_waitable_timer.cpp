/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/basic_waitable_timer.hpp"

#include <boost/assert.hpp>

namespace tessera::clock {

  BasicWaitableTimer::BasicWaitableTimer(
      std::shared_ptr<boost::asio::io_context> io_context)
      : io_context_([&] {
          BOOST_ASSERT(io_context);
          return std::move(io_context);
        }()),
        timer_{*io_context_} {}

  void BasicWaitableTimer::expiresAt(SystemClock::TimePoint at) {
    timer_.expires_at(at);
  }

  void BasicWaitableTimer::cancel() {
    timer_.cancel();
  }

  void BasicWaitableTimer::asyncWait(Handler h) {
    timer_.async_wait(std::move(h));
  }

}  // namespace tessera::clock
