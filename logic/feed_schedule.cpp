/*
 * Feed Schedule Implementation
 */

#include "logic/feed_schedule.hpp"

void feed_schedule_init(FeedScheduleState &state, uint32_t now_ms, bool due_at_boot) {
    state.last_feed_ms = now_ms;
    state.due = due_at_boot;
}

FeedEvent feed_schedule_update(FeedScheduleState &state, uint32_t now_ms, bool pressed,
                               uint32_t interval_ms) {
    if (pressed) {
        state.last_feed_ms = now_ms;
        state.due = false;
        return FeedEvent::Fed;
    }

    if (state.due) {
        return FeedEvent::None;
    }

    /* Unsigned subtraction handles uint32_t wrap */
    uint32_t elapsed = now_ms - state.last_feed_ms;
    if (elapsed >= interval_ms) {
        state.due = true;
        return FeedEvent::Due;
    }

    return FeedEvent::None;
}

uint32_t feed_remaining_ms(const FeedScheduleState &state, uint32_t now_ms,
                           uint32_t interval_ms) {
    if (state.due) {
        return 0;
    }

    uint32_t elapsed = now_ms - state.last_feed_ms;
    if (elapsed >= interval_ms) {
        return 0;  /* Not yet latched by an update */
    }
    return interval_ms - elapsed;
}

feed_remaining_t feed_split_duration(uint32_t duration_ms) {
    feed_remaining_t out = {};
    out.hours = duration_ms / MS_PER_HOUR;
    out.minutes = (duration_ms % MS_PER_HOUR) / MS_PER_MINUTE;
    return out;
}
