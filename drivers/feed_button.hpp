/*
 * Feed_Button - GPIO push button input
 * FEED_BUTTON_PIN with pull resistor chosen by FEED_BUTTON_ACTIVE_HIGH
 */

#ifndef FEED_BUTTON_HPP
#define FEED_BUTTON_HPP

#include "config.h"
#include <cstdint>

class Feed_Button {
public:
    /*
     * Configure the pin as input with pull-down (active-high wiring) or
     * pull-up (active-low wiring). Returns false if the direction or pull
     * does not read back as configured; the button then reads as released.
     */
    bool init();

    /* Raw logical level, true = pressed. Not debounced. */
    bool is_pressed() const;

private:
    bool initialized_ = false;
};

#endif // FEED_BUTTON_HPP
