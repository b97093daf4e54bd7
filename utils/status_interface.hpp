/*
 * Status_Interface - Abstract output for reminder status
 * Decouples reminder logic from the console (stdio) implementation
 */

#ifndef STATUS_INTERFACE_HPP
#define STATUS_INTERFACE_HPP

#include "types.h"
#include <cstdint>

class Status_Interface {
public:
    virtual ~Status_Interface() = default;
    virtual void show_schedule(uint32_t interval_ms, bool due_at_boot) = 0;
    virtual void show_fed(uint32_t feed_count) = 0;
    virtual void show_due() = 0;
    virtual void show_remaining(const feed_remaining_t &remaining) = 0;
    virtual void show_heartbeat(const feeder_status_t &status) = 0;
};

#endif // STATUS_INTERFACE_HPP
