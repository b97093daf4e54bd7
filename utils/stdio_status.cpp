/*
 * Stdio_Status Implementation - USB printf-based status output
 */

#include "utils/stdio_status.hpp"
#include "logic/feed_schedule.hpp"

#include <cstdio>

void Stdio_Status::show_schedule(uint32_t interval_ms, bool due_at_boot) {
    feed_remaining_t interval = feed_split_duration(interval_ms);
    printf("[INFO]  Feed: reminder every %lu hour(s) %lu minute(s), %s at boot\n",
           static_cast<unsigned long>(interval.hours),
           static_cast<unsigned long>(interval.minutes),
           due_at_boot ? "due" : "not due");
}

void Stdio_Status::show_fed(uint32_t feed_count) {
    printf("[FEED] The fish have been fed (#%lu)\n", static_cast<unsigned long>(feed_count));
}

void Stdio_Status::show_due() {
    printf("[FEED] Feeding due\n");
}

void Stdio_Status::show_remaining(const feed_remaining_t &remaining) {
    printf("[FEED] %lu hour(s) %lu minute(s) until next feeding\n",
           static_cast<unsigned long>(remaining.hours),
           static_cast<unsigned long>(remaining.minutes));
}

void Stdio_Status::show_heartbeat(const feeder_status_t &status) {
    printf("[heartbeat] uptime=%lu ms  led=%d  due=%d  remaining=%lu ms  fed=%lu  btn=%d\n",
           static_cast<unsigned long>(status.uptime_ms),
           status.led_on,
           status.reminder_due,
           static_cast<unsigned long>(status.remaining_ms),
           static_cast<unsigned long>(status.feed_count),
           status.button_pressed);
}
