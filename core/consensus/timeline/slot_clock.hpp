/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include "consensus/timeline/types.hpp"

namespace tessera::consensus {

  /// Event emitted when a new slot begins
  struct SlotTick {
    SlotNumber slot{};
    TimePoint slot_start{};
  };

  /**
   * Source of slot ticks. Slot N covers the time range
   * [N * duration, (N + 1) * duration) since the unix epoch.
   */
  class SlotClock {
   public:
    using TickHandler = std::function<void(const SlotTick &)>;

    virtual ~SlotClock() = default;

    /**
     * Starts emitting ticks to \param handler at the start of every slot.
     * Slot numbers of consecutive ticks strictly increase; slots missed
     * because the process was suspended are not replayed.
     */
    virtual void start(TickHandler handler) = 0;

    virtual void stop() = 0;

    virtual SlotDuration slotDuration() const = 0;

    /// Slot the current wall time belongs to
    virtual SlotNumber currentSlot() const = 0;

    virtual SlotNumber timeToSlot(TimePoint time) const = 0;

    virtual TimePoint slotStartTime(SlotNumber slot) const = 0;

    virtual TimePoint slotFinishTime(SlotNumber slot) const = 0;
  };

}  // namespace tessera::consensus
