#ifndef LIVENESS_MONITOR_HPP
#define LIVENESS_MONITOR_HPP

#include <cstdint>
#include <main/config/monitoring.hpp>
#include <main/models/device_status.hpp>

// Arrival-cadence watch for one device. The OFFLINE overlay is derived at
// read time from the last receipt; the reported state is kept untouched.
class LivenessMonitor {
public:
    explicit LivenessMonitor(uint32_t timeout_ms = Config::Console::liveness_timeout_ms);

    // Record an arrival. Returns true if the device was offline until now.
    bool onReport(DeviceState reported, uint32_t now_ms);

    // What the console shows: OFFLINE when silent for timeout_ms or more,
    // otherwise the last reported state. Never-seen devices are OFFLINE.
    DeviceState displayedState(uint32_t now_ms) const;

    bool isOffline(uint32_t now_ms) const;

    // Returns true once per silence period, on the first evaluation that
    // finds the device offline.
    bool checkWentOffline(uint32_t now_ms);

    bool hasReported() const { return has_report; }
    DeviceState reportedState() const { return reported; }
    uint32_t lastReceiptMs() const { return last_receipt_ms; }

private:
    uint32_t    timeout_ms;
    uint32_t    last_receipt_ms;
    DeviceState reported;
    bool        has_report;
    bool        offline_announced;
};

#endif // LIVENESS_MONITOR_HPP
