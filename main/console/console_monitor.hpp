#ifndef CONSOLE_MONITOR_HPP
#define CONSOLE_MONITOR_HPP

#include <cstddef>
#include <cstdint>
#include <main/config/monitoring.hpp>
#include <main/console/alert_log.hpp>
#include <main/console/analytics_aggregator.hpp>
#include <main/console/announcement_gate.hpp>
#include <main/console/liveness_monitor.hpp>
#include <main/console/location_trail.hpp>
#include <main/models/telemetry_report.hpp>

// Operational picture for every device the console has heard from.
// Not thread-safe: a single owner (the console task) applies all updates,
// which serializes them per device.
class ConsoleMonitor {
public:
    enum class AcceptResult : uint8_t {
        ACCEPTED = 0,
        DUPLICATE,          // latest state refreshed, windows untouched
        DEVICE_TABLE_FULL,
        INVALID
    };

    struct DeviceView {
        const char*                device_id;
        const LivenessMonitor*     liveness;
        const AnalyticsAggregator* analytics;
        const LocationTrail*       trail;
    };

    explicit ConsoleMonitor(uint32_t liveness_timeout_ms = Config::Console::liveness_timeout_ms);

    // Apply one arrival. clock may be null when wall time is unknown.
    AcceptResult accept(const TelemetryReport& report, uint32_t now_ms, const char* clock = nullptr);

    // Make sure device_id has a record before its report is queued.
    // A full table gives up the slot of the longest-silent device that is
    // already offline; DEVICE_TABLE_FULL when every device is live.
    AcceptResult reserve(const char* device_id, uint32_t now_ms);

    // Periodic liveness pass; logs devices that just went silent.
    void tick(uint32_t now_ms, const char* clock = nullptr);

    DeviceState displayedState(const char* device_id, uint32_t now_ms) const;

    // True when the console alarm should sound for this device now
    bool shouldAnnounce(std::size_t index, uint32_t now_ms, DeviceState& out_state);

    std::size_t deviceCount() const { return device_count; }
    bool device(std::size_t index, DeviceView& out) const;
    bool find(const char* device_id, DeviceView& out) const;

    const AlertLog& alerts() const { return alert_log; }
    // Records given up to make room for another device
    uint32_t evictedCount() const { return evicted; }

    static const char* causeText(const TelemetryReport& report, DeviceState state);

private:
    struct DeviceRecord {
        char                device_id[Config::Telemetry::device_id_max_len];
        LivenessMonitor     liveness;
        AnalyticsAggregator analytics;
        LocationTrail       trail;
        AnnouncementGate    gate;
        uint32_t            reserved_ms;
        bool                has_last_report;
        TelemetryReport     last_report;
    };

    int indexOf(const char* device_id) const;
    int registerDevice(const char* device_id, uint32_t now_ms);
    int evictableIndex(uint32_t now_ms) const;
    static bool sameSample(const TelemetryReport& a, const TelemetryReport& b);
    void fillView(const DeviceRecord& record, DeviceView& out) const;

    uint32_t     liveness_timeout_ms;
    DeviceRecord records[Config::Console::max_devices];
    std::size_t  device_count;
    AlertLog     alert_log;
    uint32_t     evicted;
};

#endif // CONSOLE_MONITOR_HPP
