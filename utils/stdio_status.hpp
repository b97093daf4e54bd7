/*
 * Stdio_Status - USB printf-based status output
 * Writes reminder events to the serial console via USB CDC
 */

#ifndef STDIO_STATUS_HPP
#define STDIO_STATUS_HPP

#include "status_interface.hpp"

class Stdio_Status final : public Status_Interface {
public:
    void show_schedule(uint32_t interval_ms, bool due_at_boot) override;
    void show_fed(uint32_t feed_count) override;
    void show_due() override;
    void show_remaining(const feed_remaining_t &remaining) override;
    void show_heartbeat(const feeder_status_t &status) override;
};

#endif // STDIO_STATUS_HPP
