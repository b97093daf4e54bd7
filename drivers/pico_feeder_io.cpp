/*
 * Pico_Feeder_IO Implementation
 */

#include "drivers/pico_feeder_io.hpp"
#include "pico/time.h"

uint32_t Pico_Feeder_IO::now_ms() {
    return to_ms_since_boot(get_absolute_time());
}

bool Pico_Feeder_IO::button_pressed() {
    return button_.is_pressed();
}

void Pico_Feeder_IO::set_indicator(bool on) {
    indicator_.set(on);
}

bool Pico_Feeder_IO::indicator_on() {
    return indicator_.is_on();
}
