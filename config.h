/*
 * Hardware Configuration for RP2040 Fish Feed Reminder Firmware
 * Single button, single LED - all timing is compile-time
 */

#ifndef FEEDER_CONFIG_H
#define FEEDER_CONFIG_H

/*============================================================================
 * Feed Indicator LED
 *============================================================================*/
#define FEED_LED_PIN                0U       /* GP0 -> LED -> 220R -> GND */

/*============================================================================
 * Feed Button
 *============================================================================*/
#define FEED_BUTTON_PIN             1U       /* GP1 -> button -> 3V3 OUT (pin 37) */
#define FEED_BUTTON_ACTIVE_HIGH     1        /* 1: pull-down, pressed = high. 0: pull-up, pressed = low */
#define FEED_DEBOUNCE_MS            50U      /* Debounce interval (ms) */

/*============================================================================
 * Feeding Schedule
 *============================================================================*/
#define FEED_DELAY_HR               6U       /* Hours between feedings */
#define FEED_DELAY_MIN              0U       /* Additional minutes between feedings */
#define FEED_DUE_AT_BOOT            1        /* Power up with the reminder lit */

/*============================================================================
 * Main Loop Timing
 *============================================================================*/
#define FEED_POLL_MS                10U      /* Cooperative loop delay */
#define FEED_STATUS_INTERVAL_MS     60000U   /* Time-remaining report period */
#define FEED_WATCHDOG_TIMEOUT_MS    2000U    /* 200 missed polls = reboot */
#define USB_CONNECT_WAIT_MS         5000U    /* Max wait for USB host before banner */

/*============================================================================
 * System Clock
 *============================================================================*/
#define SYS_CLOCK_KHZ               62500U   /* Half of the 125MHz default, lower power */

#endif /* FEEDER_CONFIG_H */
