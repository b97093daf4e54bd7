/*
 * RP2040 Fish Feed Reminder Firmware - Main Entry Point
 * Lowers the system clock, brings up the button and LED, enters main loop
 */

#include "config.h"
#include "types.h"

#include "drivers/feed_button.hpp"
#include "drivers/feed_indicator.hpp"
#include "drivers/pico_feeder_io.hpp"
#include "logic/feed_schedule.hpp"
#include "logic/reminder_controller.hpp"
#include "utils/stdio_status.hpp"

#include "pico/stdlib.h"
#include "pico/stdio_usb.h"
#include "hardware/watchdog.h"
#include "hardware/clocks.h"

#include <cstdio>

static constexpr uint32_t FEED_INTERVAL_MS = feed_interval_ms(FEED_DELAY_HR, FEED_DELAY_MIN);

static_assert(FEED_DELAY_MIN < 60U, "FEED_DELAY_MIN must be 0-59");
static_assert(FEED_DELAY_HR < 1193U, "Feed delay must fit the 32-bit ms tick counter");

int main() {
    /* clk_sys must change before stdio init. clk_peri follows clk_sys, USB stays on pll_usb */
    bool clock_ok = set_sys_clock_khz(SYS_CLOCK_KHZ, false);

    stdio_init_all();

    // Wait for USB host serial connection, then proceed regardless.
    // Without this, early printf output is buffered and lost.
    for (uint32_t waited = 0; waited < USB_CONNECT_WAIT_MS && !stdio_usb_connected();
         waited += 100U) {
        sleep_ms(100);
    }

    printf("\n========================================\n");
    printf("RP2040 Fish Feed Reminder\n");
    printf("Build: %s %s\n", __DATE__, __TIME__);
    printf("Board: %s\n", PICO_BOARD);
    printf("SDK:   %s\n", PICO_SDK_VERSION_STRING);
    printf("Clock: %lu kHz\n",
           static_cast<unsigned long>(clock_get_hz(clk_sys) / 1000U));
    printf("========================================\n\n");

    if (!clock_ok) {
        printf("[WARN] Could not set clk_sys to %lu kHz, running at default\n",
               static_cast<unsigned long>(SYS_CLOCK_KHZ));
    }
    if (watchdog_caused_reboot()) {
        printf("[WARN] Recovered from watchdog reboot\n");
    }
    stdio_flush();

    static Feed_Button button;
    static Feed_Indicator indicator;

    if (!button.init()) {
        printf("[ERROR] Feed button init FAILED on GP%u\n", FEED_BUTTON_PIN);
    }
    if (!indicator.init(FEED_DUE_AT_BOOT != 0)) {
        printf("[ERROR] Feed indicator init FAILED on GP%u\n", FEED_LED_PIN);
    }
    printf("[BOOT] Button GP%u (%s), LED GP%u\n", FEED_BUTTON_PIN,
           FEED_BUTTON_ACTIVE_HIGH ? "active-high" : "active-low", FEED_LED_PIN);

    static Pico_Feeder_IO io(button, indicator);
    static Stdio_Status status;
    static Reminder_Controller controller(io, status, FEED_INTERVAL_MS, FEED_DEBOUNCE_MS,
                                          FEED_STATUS_INTERVAL_MS);
    controller.init(FEED_DUE_AT_BOOT != 0);

    watchdog_enable(FEED_WATCHDOG_TIMEOUT_MS, true);

    printf("[INFO]  Sys: Entering main loop\n");
    stdio_flush();

    static constexpr uint32_t HEARTBEAT_INTERVAL = 3000;  // iterations (~30s at 10ms sleep)
    uint32_t loop_count = 0;

    while (true) {
        watchdog_update();

        controller.tick();

        if (++loop_count >= HEARTBEAT_INTERVAL) {
            if (!controller.verify_indicator()) {
                printf("[WARN] LED GP%u read back wrong level, re-driven\n", FEED_LED_PIN);
            }
            status.show_heartbeat(controller.snapshot());
            stdio_flush();
            loop_count = 0;
        }

        sleep_ms(FEED_POLL_MS);
    }
}
