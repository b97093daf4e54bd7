/*
 * Feed_Indicator Implementation
 */

#include "drivers/feed_indicator.hpp"
#include "hardware/gpio.h"

bool Feed_Indicator::init(bool initial_on) {
    if (!initialized_) {
        gpio_init(FEED_LED_PIN);
        gpio_set_dir(FEED_LED_PIN, GPIO_OUT);
        initialized_ = true;
    }

    set(initial_on);

    return is_on() == initial_on;
}

void Feed_Indicator::set(bool on) {
    if (!initialized_) {
        return;
    }
    gpio_put(FEED_LED_PIN, on);
}

bool Feed_Indicator::is_on() const {
    if (!initialized_) {
        return false;
    }
    return gpio_get_out_level(FEED_LED_PIN);
}
