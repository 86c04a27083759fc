/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/timeline/impl/slot_clock_impl.hpp"

#include <boost/asio/error.hpp>

namespace tessera::consensus {

  SlotClockImpl::SlotClockImpl(std::shared_ptr<Clock> clock,
                               std::unique_ptr<clock::Timer> timer,
                               SlotDuration slot_duration)
      : log_{log::createLogger("SlotClock", "timeline")},
        clock_{std::move(clock)},
        timer_{std::move(timer)},
        slot_duration_{slot_duration} {
    BOOST_ASSERT(clock_);
    BOOST_ASSERT(timer_);
    BOOST_ASSERT(slot_duration_.count() > 0);
  }

  void SlotClockImpl::start(TickHandler handler) {
    BOOST_ASSERT(handler);
    {
      std::lock_guard lock{mutex_};
      if (started_) {
        return;
      }
      started_ = true;
      handler_ = std::move(handler);
    }
    SL_DEBUG(log_,
             "Slot clock started at slot {} ({} ms per slot)",
             currentSlot(),
             slot_duration_.count());
    scheduleNext();
  }

  void SlotClockImpl::stop() {
    std::lock_guard lock{mutex_};
    if (not started_) {
      return;
    }
    started_ = false;
    timer_->cancel();
  }

  SlotDuration SlotClockImpl::slotDuration() const {
    return slot_duration_;
  }

  SlotNumber SlotClockImpl::currentSlot() const {
    return timeToSlot(clock_->now());
  }

  SlotNumber SlotClockImpl::timeToSlot(TimePoint time) const {
    auto since_epoch =
        std::chrono::duration_cast<SlotDuration>(time.time_since_epoch());
    return static_cast<SlotNumber>(since_epoch.count())
         / static_cast<SlotNumber>(slot_duration_.count());
  }

  TimePoint SlotClockImpl::slotStartTime(SlotNumber slot) const {
    return TimePoint{}
         + std::chrono::duration_cast<Clock::Duration>(
               slot_duration_ * static_cast<SlotDuration::rep>(slot));
  }

  TimePoint SlotClockImpl::slotFinishTime(SlotNumber slot) const {
    return slotStartTime(slot + 1);
  }

  void SlotClockImpl::scheduleNext() {
    std::lock_guard lock{mutex_};
    if (not started_) {
      return;
    }
    auto next_slot = currentSlot() + 1;
    if (last_emitted_.has_value() and next_slot <= *last_emitted_) {
      next_slot = *last_emitted_ + 1;
    }
    timer_->expiresAt(slotStartTime(next_slot));
    timer_->asyncWait(
        [weak_self{weak_from_this()}](const boost::system::error_code &ec) {
          if (auto self = weak_self.lock()) {
            self->onTimer(ec);
          }
        });
  }

  void SlotClockImpl::onTimer(const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    if (ec) {
      SL_ERROR(log_, "Slot timer failed: {}", ec.message());
      return;
    }

    TickHandler handler;
    SlotTick tick;
    {
      std::lock_guard lock{mutex_};
      if (not started_) {
        return;
      }
      auto slot = currentSlot();
      // Timer may fire slightly before the clock reaches the slot boundary
      if (not last_emitted_.has_value() or slot > *last_emitted_) {
        if (last_emitted_.has_value() and slot > *last_emitted_ + 1) {
          SL_VERBOSE(log_,
                     "Slots {}..{} were missed",
                     *last_emitted_ + 1,
                     slot - 1);
        }
        last_emitted_ = slot;
        tick = SlotTick{.slot = slot, .slot_start = slotStartTime(slot)};
        handler = handler_;
      }
    }

    if (handler) {
      SL_TRACE(log_, "Slot {} started", tick.slot);
      handler(tick);
    }
    scheduleNext();
  }

}  // namespace tessera::consensus
