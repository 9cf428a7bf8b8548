#include <main/console/console_monitor.hpp>
#include <cstdio>
#include <cstring>

ConsoleMonitor::ConsoleMonitor(uint32_t liveness_timeout_ms)
    : liveness_timeout_ms(liveness_timeout_ms),
      device_count(0),
      evicted(0) {}

int ConsoleMonitor::indexOf(const char* device_id) const {
    for (std::size_t i = 0; i < device_count; ++i) {
        if (std::strncmp(records[i].device_id, device_id, sizeof(records[i].device_id)) == 0) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int ConsoleMonitor::evictableIndex(uint32_t now_ms) const {
    int oldest = -1;
    uint32_t oldest_silence = 0;
    for (std::size_t i = 0; i < device_count; ++i) {
        const DeviceRecord& record = records[i];
        // A reservation that never got its report ages like a receipt
        uint32_t last_heard = record.liveness.hasReported() ? record.liveness.lastReceiptMs()
                                                            : record.reserved_ms;
        uint32_t silence = now_ms - last_heard;
        if (silence < liveness_timeout_ms) {
            continue;
        }
        if (oldest < 0 || silence > oldest_silence) {
            oldest = static_cast<int>(i);
            oldest_silence = silence;
        }
    }
    return oldest;
}

int ConsoleMonitor::registerDevice(const char* device_id, uint32_t now_ms) {
    int idx;
    if (device_count < Config::Console::max_devices) {
        idx = static_cast<int>(device_count++);
    } else {
        idx = evictableIndex(now_ms);
        if (idx < 0) {
            return -1;
        }
        ++evicted;
    }
    DeviceRecord& record = records[idx];
    std::snprintf(record.device_id, sizeof(record.device_id), "%s", device_id);
    record.liveness = LivenessMonitor(liveness_timeout_ms);
    record.analytics = AnalyticsAggregator{};
    record.trail = LocationTrail{};
    record.gate = AnnouncementGate{};
    record.reserved_ms = now_ms;
    record.has_last_report = false;
    record.last_report = TelemetryReport{};
    return idx;
}

ConsoleMonitor::AcceptResult ConsoleMonitor::reserve(const char* device_id, uint32_t now_ms) {
    if (device_id == nullptr || device_id[0] == '\0') {
        return AcceptResult::INVALID;
    }
    if (indexOf(device_id) >= 0 || registerDevice(device_id, now_ms) >= 0) {
        return AcceptResult::ACCEPTED;
    }
    return AcceptResult::DEVICE_TABLE_FULL;
}

bool ConsoleMonitor::sameSample(const TelemetryReport& a, const TelemetryReport& b) {
    return a.has_state == b.has_state && a.state == b.state && a.causes == b.causes &&
           a.temperature_valid == b.temperature_valid && a.temperature_c == b.temperature_c &&
           a.has_motion == b.has_motion && a.moving == b.moving && a.still_s == b.still_s &&
           a.has_position == b.has_position && a.latitude == b.latitude && a.longitude == b.longitude &&
           a.has_health == b.has_health && a.sensors_ok == b.sensors_ok;
}

const char* ConsoleMonitor::causeText(const TelemetryReport& report, DeviceState state) {
    if (state == DeviceState::SOS) {
        return "SOS signal received";
    }
    bool temp = (report.causes & (CAUSE_TEMP_HIGH | CAUSE_TEMP_CRITICAL)) != 0;
    bool still = (report.causes & (CAUSE_STILL_WARNING | CAUSE_STILL_EMERGENCY)) != 0;
    if (temp && still) {
        return "High temperature, no movement";
    }
    if (temp) {
        return "High temperature";
    }
    if (still) {
        return "No movement detected";
    }
    if (report.has_health && !report.sensors_ok) {
        return "Sensor failure";
    }
    switch (state) {
        case DeviceState::WARNING:   return "Status changed to WARNING";
        case DeviceState::EMERGENCY: return "Status changed to EMERGENCY";
        default:                     return "Status changed";
    }
}

ConsoleMonitor::AcceptResult ConsoleMonitor::accept(const TelemetryReport& report, uint32_t now_ms,
                                                    const char* clock) {
    if (report.device_id[0] == '\0') {
        return AcceptResult::INVALID;
    }
    int idx = indexOf(report.device_id);
    if (idx < 0) {
        idx = registerDevice(report.device_id, now_ms);
        if (idx < 0) {
            return AcceptResult::DEVICE_TABLE_FULL;
        }
    }
    DeviceRecord& record = records[idx];

    bool had_report = record.liveness.hasReported();
    DeviceState previous = record.liveness.reportedState();
    // A report without status is a heartbeat for the last known state
    DeviceState state = report.has_state ? report.state
                                         : (had_report ? previous : DeviceState::NORMAL);

    // Device time restarts with the device, so an equal timestamp alone
    // does not make a duplicate; the readings must match as well
    bool duplicate = had_report && state == previous && record.has_last_report &&
                     report.has_device_ts && record.last_report.has_device_ts &&
                     report.device_ts_ms == record.last_report.device_ts_ms &&
                     sameSample(report, record.last_report);

    if (record.liveness.onReport(state, now_ms)) {
        alert_log.append(now_ms, clock, record.device_id, state, "Telemetry resumed");
    }
    if ((!had_report || state != previous) && DeviceStatus::atLeast(state, DeviceState::WARNING)) {
        alert_log.append(now_ms, clock, record.device_id, state, causeText(report, state));
    }

    record.last_report = report;
    record.has_last_report = true;
    if (duplicate) {
        return AcceptResult::DUPLICATE;
    }

    record.analytics.onReport(report, state);
    if (report.has_position) {
        (void)record.trail.add(report.latitude, report.longitude);
    }
    return AcceptResult::ACCEPTED;
}

void ConsoleMonitor::tick(uint32_t now_ms, const char* clock) {
    for (std::size_t i = 0; i < device_count; ++i) {
        DeviceRecord& record = records[i];
        if (record.liveness.checkWentOffline(now_ms)) {
            alert_log.append(now_ms, clock, record.device_id, DeviceState::OFFLINE, "No telemetry received");
        }
    }
}

DeviceState ConsoleMonitor::displayedState(const char* device_id, uint32_t now_ms) const {
    int idx = indexOf(device_id);
    if (idx < 0) {
        return DeviceState::OFFLINE;
    }
    return records[idx].liveness.displayedState(now_ms);
}

bool ConsoleMonitor::shouldAnnounce(std::size_t index, uint32_t now_ms, DeviceState& out_state) {
    if (index >= device_count) {
        return false;
    }
    DeviceRecord& record = records[index];
    DeviceState shown = record.liveness.displayedState(now_ms);
    if (!record.gate.shouldAnnounce(shown, now_ms)) {
        return false;
    }
    out_state = shown;
    return true;
}

void ConsoleMonitor::fillView(const DeviceRecord& record, DeviceView& out) const {
    out.device_id = record.device_id;
    out.liveness = &record.liveness;
    out.analytics = &record.analytics;
    out.trail = &record.trail;
}

bool ConsoleMonitor::device(std::size_t index, DeviceView& out) const {
    if (index >= device_count) {
        return false;
    }
    fillView(records[index], out);
    return true;
}

bool ConsoleMonitor::find(const char* device_id, DeviceView& out) const {
    int idx = indexOf(device_id);
    if (idx < 0) {
        return false;
    }
    fillView(records[idx], out);
    return true;
}
