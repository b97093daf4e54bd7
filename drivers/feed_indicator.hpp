/*
 * Feed_Indicator - GPIO LED output (active-high)
 */

#ifndef FEED_INDICATOR_HPP
#define FEED_INDICATOR_HPP

#include "config.h"
#include <cstdint>

class Feed_Indicator {
public:
    /* Configure FEED_LED_PIN as output and drive the initial level */
    bool init(bool initial_on);

    void set(bool on);

    /* Output latch read back from the pin, false if not initialized */
    bool is_on() const;

private:
    bool initialized_ = false;
};

#endif // FEED_INDICATOR_HPP
