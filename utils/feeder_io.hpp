/*
 * Feeder_IO - Abstract hardware access for the reminder controller
 * Decouples reminder logic from GPIO and the SDK clock (host-testable)
 */

#ifndef FEEDER_IO_HPP
#define FEEDER_IO_HPP

#include <cstdint>

class Feeder_IO {
public:
    virtual ~Feeder_IO() = default;

    /* Monotonic milliseconds, wraps at 2^32 */
    virtual uint32_t now_ms() = 0;

    /* Raw logical button level, polarity already applied. Not debounced. */
    virtual bool button_pressed() = 0;

    virtual void set_indicator(bool on) = 0;

    /* Indicator level read back from the output */
    virtual bool indicator_on() = 0;
};

#endif // FEEDER_IO_HPP
