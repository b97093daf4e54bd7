/*
 * Pico_Feeder_IO - Feeder_IO backed by RP2040 GPIO and the SDK timer
 */

#ifndef PICO_FEEDER_IO_HPP
#define PICO_FEEDER_IO_HPP

#include "drivers/feed_button.hpp"
#include "drivers/feed_indicator.hpp"
#include "utils/feeder_io.hpp"

class Pico_Feeder_IO final : public Feeder_IO {
public:
    Pico_Feeder_IO(Feed_Button &button, Feed_Indicator &indicator)
        : button_(button), indicator_(indicator) {}

    uint32_t now_ms() override;
    bool button_pressed() override;
    void set_indicator(bool on) override;
    bool indicator_on() override;

private:
    Feed_Button &button_;
    Feed_Indicator &indicator_;
};

#endif // PICO_FEEDER_IO_HPP
