/*
 * Reminder_Controller Implementation
 */

#include "logic/reminder_controller.hpp"

Reminder_Controller::Reminder_Controller(Feeder_IO &io, Status_Interface &status,
                                         uint32_t interval_ms, uint32_t debounce_ms,
                                         uint32_t status_interval_ms)
    : io_(io),
      status_(status),
      interval_ms_(interval_ms),
      debounce_ms_(debounce_ms),
      status_interval_ms_(status_interval_ms) {}

void Reminder_Controller::init(bool due_at_boot) {
    uint32_t now = io_.now_ms();
    last_tick_ms_ = now;
    last_status_ms_ = now;

    /* Start from released so a button held at power-up still registers */
    debounce_ = {};
    debounce_.last_change_ms = now;

    feed_schedule_init(schedule_, now, due_at_boot);
    set_led(schedule_.due);
    status_.show_schedule(interval_ms_, due_at_boot);
}

void Reminder_Controller::tick() {
    uint32_t now = io_.now_ms();
    last_tick_ms_ = now;

    ButtonEdge edge = debounce_update(now, io_.button_pressed(), debounce_ms_, debounce_);

    /* Timer follows the debounced level: a held button keeps it reset */
    FeedEvent event = feed_schedule_update(schedule_, now, debounce_.stable_pressed,
                                           interval_ms_);

    switch (event) {
        case FeedEvent::Fed:
            if (led_on_) {
                set_led(false);
            }
            last_status_ms_ = now;

            /* Count and report once per press, not once per held poll */
            if (edge == ButtonEdge::Pressed) {
                feed_count_++;
                status_.show_fed(feed_count_);
            }
            break;
        case FeedEvent::Due:
            set_led(true);
            status_.show_due();
            break;
        case FeedEvent::None:
            break;
    }

    /* Periodic time-remaining report while waiting for the next feeding */
    if (!schedule_.due && (now - last_status_ms_) >= status_interval_ms_) {
        last_status_ms_ = now;
        status_.show_remaining(feed_split_duration(remaining_ms()));
    }
}

uint32_t Reminder_Controller::remaining_ms() const {
    return feed_remaining_ms(schedule_, last_tick_ms_, interval_ms_);
}

feeder_status_t Reminder_Controller::snapshot() const {
    feeder_status_t out = {};
    out.uptime_ms = last_tick_ms_;
    out.remaining_ms = remaining_ms();
    out.feed_count = feed_count_;
    out.led_on = led_on_;
    out.reminder_due = schedule_.due;
    out.button_pressed = debounce_.stable_pressed;
    return out;
}

bool Reminder_Controller::verify_indicator() {
    if (io_.indicator_on() == led_on_) {
        return true;
    }

    /* Output latch disagrees with the reminder state: drive it again */
    io_.set_indicator(led_on_);
    return false;
}

void Reminder_Controller::set_led(bool on) {
    io_.set_indicator(on);
    led_on_ = on;
}
