/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/timeline/slot_clock.hpp"

#include <memory>
#include <mutex>
#include <optional>

#include "clock/timer.hpp"
#include "log/logger.hpp"

namespace tessera::consensus {

  class SlotClockImpl : public SlotClock,
                        public std::enable_shared_from_this<SlotClockImpl> {
   public:
    SlotClockImpl(std::shared_ptr<Clock> clock,
                  std::unique_ptr<clock::Timer> timer,
                  SlotDuration slot_duration);

    void start(TickHandler handler) override;

    void stop() override;

    SlotDuration slotDuration() const override;

    SlotNumber currentSlot() const override;

    SlotNumber timeToSlot(TimePoint time) const override;

    TimePoint slotStartTime(SlotNumber slot) const override;

    TimePoint slotFinishTime(SlotNumber slot) const override;

   private:
    void scheduleNext();

    void onTimer(const boost::system::error_code &ec);

    log::Logger log_;
    std::shared_ptr<Clock> clock_;
    std::unique_ptr<clock::Timer> timer_;
    const SlotDuration slot_duration_;

    std::mutex mutex_;
    TickHandler handler_;
    bool started_ = false;
    std::optional<SlotNumber> last_emitted_;
  };

}  // namespace tessera::consensus
