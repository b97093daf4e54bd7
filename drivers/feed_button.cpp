/*
 * Feed_Button Implementation
 */

#include "drivers/feed_button.hpp"
#include "hardware/gpio.h"

bool Feed_Button::init() {
    if (initialized_) {
        return true;
    }

    gpio_init(FEED_BUTTON_PIN);
    gpio_set_dir(FEED_BUTTON_PIN, GPIO_IN);
#if FEED_BUTTON_ACTIVE_HIGH
    gpio_pull_down(FEED_BUTTON_PIN);
#else
    gpio_pull_up(FEED_BUTTON_PIN);
#endif

    /* Confirm the pad took the input direction and pull */
#if FEED_BUTTON_ACTIVE_HIGH
    bool pull_ok = gpio_is_pulled_down(FEED_BUTTON_PIN);
#else
    bool pull_ok = gpio_is_pulled_up(FEED_BUTTON_PIN);
#endif
    initialized_ = !gpio_is_dir_out(FEED_BUTTON_PIN) && pull_ok;
    return initialized_;
}

bool Feed_Button::is_pressed() const {
    /* Unconfigured pin reads as not pressed */
    if (!initialized_) {
        return false;
    }

    bool level = gpio_get(FEED_BUTTON_PIN);
#if FEED_BUTTON_ACTIVE_HIGH
    return level;
#else
    return !level;
#endif
}
