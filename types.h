/*
 * Core Type Definitions for RP2040 Fish Feed Reminder Firmware
 */

#ifndef FEEDER_TYPES_H
#define FEEDER_TYPES_H

#include <stdint.h>
#include <stdbool.h>

/*============================================================================
 * Feeder Status Snapshot
 *============================================================================
 *
 * Read-only view of the reminder state, produced by the controller once per
 * heartbeat and consumed by status output. Never written back.
 *
 * remaining_ms is 0 whenever reminder_due is set.
 */

typedef struct {
    uint32_t uptime_ms;       /* Tick count at snapshot time */
    uint32_t remaining_ms;    /* Time until the next feeding is due */
    uint32_t feed_count;      /* Presses accepted since boot */
    bool     led_on;          /* Indicator output state */
    bool     reminder_due;    /* Due latch */
    bool     button_pressed;  /* Debounced button level */
} feeder_status_t;

/*============================================================================
 * Remaining Time Breakdown
 *============================================================================*/

typedef struct {
    uint32_t hours;
    uint32_t minutes;  /* 0-59, rounded down */
} feed_remaining_t;

#endif /* FEEDER_TYPES_H */
