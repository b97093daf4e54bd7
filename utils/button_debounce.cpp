/*
 * Button Debounce Implementation
 */

#include "utils/button_debounce.hpp"

ButtonEdge debounce_update(uint32_t now_ms, bool raw_pressed, uint32_t debounce_ms,
                           DebounceState &state) {
    if (raw_pressed != state.last_raw) {
        state.last_raw = raw_pressed;
        state.last_change_ms = now_ms;
        return ButtonEdge::None;
    }

    /* Unsigned subtraction handles uint32_t wrap */
    if ((now_ms - state.last_change_ms) < debounce_ms) {
        return ButtonEdge::None;
    }

    if (raw_pressed == state.stable_pressed) {
        return ButtonEdge::None;
    }

    state.stable_pressed = raw_pressed;
    return raw_pressed ? ButtonEdge::Pressed : ButtonEdge::Released;
}
