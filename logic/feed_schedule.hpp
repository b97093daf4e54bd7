/*
 * Feed Schedule - Pure Algorithms (no SDK dependencies)
 * Reminder interval arithmetic, due latch, time-remaining breakdown
 */

#ifndef FEED_SCHEDULE_HPP
#define FEED_SCHEDULE_HPP

#include "types.h"
#include <cstdint>

static constexpr uint32_t MS_PER_MINUTE = 60U * 1000U;
static constexpr uint32_t MS_PER_HOUR = 60U * MS_PER_MINUTE;

/*
 * Convert a feeding delay to milliseconds.
 * Must stay below 2^32 ms (~1193 h) so elapsed time fits the tick counter.
 */
constexpr uint32_t feed_interval_ms(uint32_t hours, uint32_t minutes) {
    return (hours * MS_PER_HOUR) + (minutes * MS_PER_MINUTE);
}

enum class FeedEvent : uint8_t {
    None,
    Fed,  /* Button pressed: timer reset, reminder cleared */
    Due   /* Interval elapsed: reminder latched on */
};

struct FeedScheduleState {
    uint32_t last_feed_ms = 0;  /* Last poll with the button pressed */
    bool due = false;           /* Latched until the next press */
};

/*
 * Arm the schedule at boot.
 * due_at_boot = true treats the time since the (unknown) last feeding as
 * unbounded, so the reminder starts latched.
 */
void feed_schedule_init(FeedScheduleState &state, uint32_t now_ms, bool due_at_boot);

/*
 * Advance the schedule by one poll.
 *
 * pressed is the debounced button level. While it is set the timer is
 * reset and the latch cleared on every poll, whatever the prior state.
 * Otherwise the latch is set once elapsed >= interval_ms and stays set
 * across tick counter wrap.
 *
 * @return Event that changed the reminder state on this poll
 */
FeedEvent feed_schedule_update(FeedScheduleState &state, uint32_t now_ms, bool pressed,
                               uint32_t interval_ms);

/* Milliseconds until the reminder fires, 0 when due */
uint32_t feed_remaining_ms(const FeedScheduleState &state, uint32_t now_ms,
                           uint32_t interval_ms);

/* Split a duration into whole hours and minutes (seconds dropped) */
feed_remaining_t feed_split_duration(uint32_t duration_ms);

#endif // FEED_SCHEDULE_HPP
