/*
 * Reminder_Controller - Feed reminder state machine
 * Debounces the feed button, tracks time since the last feeding and drives
 * the indicator LED. One tick() per cooperative loop iteration.
 */

#ifndef REMINDER_CONTROLLER_HPP
#define REMINDER_CONTROLLER_HPP

#include "types.h"
#include "logic/feed_schedule.hpp"
#include "utils/button_debounce.hpp"
#include "utils/feeder_io.hpp"
#include "utils/status_interface.hpp"

#include <cstdint>

class Reminder_Controller {
public:
    Reminder_Controller(Feeder_IO &io, Status_Interface &status,
                        uint32_t interval_ms, uint32_t debounce_ms,
                        uint32_t status_interval_ms);

    /*
     * Start the feeding timer and write the initial LED state.
     * Call once before the first tick().
     */
    void init(bool due_at_boot);

    /*
     * Poll the button and update the reminder.
     * While the debounced button is pressed the timer is held at zero and
     * the LED is off; otherwise the LED turns on once the interval has
     * elapsed. feed_count() and the "fed" report advance once per press.
     */
    void tick();

    bool led_on() const { return led_on_; }
    bool reminder_due() const { return schedule_.due; }
    uint32_t feed_count() const { return feed_count_; }

    /* Time until the reminder fires, as of the last tick */
    uint32_t remaining_ms() const;

    feeder_status_t snapshot() const;

    /*
     * Compare the indicator read-back with the reminder state and re-drive
     * the LED on mismatch. Returns false if a correction was needed.
     */
    bool verify_indicator();

private:
    void set_led(bool on);

    Feeder_IO &io_;
    Status_Interface &status_;
    const uint32_t interval_ms_;
    const uint32_t debounce_ms_;
    const uint32_t status_interval_ms_;

    DebounceState debounce_ = {};
    FeedScheduleState schedule_ = {};
    uint32_t last_tick_ms_ = 0;
    uint32_t last_status_ms_ = 0;
    uint32_t feed_count_ = 0;
    bool led_on_ = false;
};

#endif // REMINDER_CONTROLLER_HPP
