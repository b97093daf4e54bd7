/*
 * Button Debounce - Pure logic, no GPIO dependency
 * Reports both edges so callers can track presses and releases
 */

#ifndef BUTTON_DEBOUNCE_HPP
#define BUTTON_DEBOUNCE_HPP

#include <cstdint>

enum class ButtonEdge : uint8_t {
    None,
    Pressed,   /* Debounced released->pressed transition */
    Released   /* Debounced pressed->released transition */
};

struct DebounceState {
    bool stable_pressed = false;  /* Debounced logical level */
    bool last_raw = false;        /* Last raw sample (true = pressed) */
    uint32_t last_change_ms = 0;  /* Timestamp of last raw change */
};

/*
 * Feed one raw sample into the debouncer.
 *
 * @param now_ms       Current timestamp in milliseconds
 * @param raw_pressed  Logical pressed level (driver applies pin polarity)
 * @param debounce_ms  Time the raw level must hold before it is accepted
 * @param state        Persistent debounce state (caller-owned)
 * @return Edge accepted on this sample, at most one per change
 */
ButtonEdge debounce_update(uint32_t now_ms, bool raw_pressed, uint32_t debounce_ms,
                           DebounceState &state);

#endif /* BUTTON_DEBOUNCE_HPP */
