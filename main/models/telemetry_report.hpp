#ifndef TELEMETRY_REPORT_HPP
#define TELEMETRY_REPORT_HPP

#include <cstdint>
#include <main/config/monitoring.hpp>
#include <main/models/device_status.hpp>

// Console-side view of one arrival, decoded from either a full MQTT
// envelope or a reduced ingress body. Only device_id is mandatory.
struct TelemetryReport {
    char        device_id[Config::Telemetry::device_id_max_len] = {0};

    bool        has_state = false;
    DeviceState state = DeviceState::NORMAL;
    uint8_t     causes = CAUSE_NONE;  // recovered from the status suffix

    bool        temperature_valid = false;
    float       temperature_c = 0.0f;

    bool        has_motion = false;
    bool        moving = false;
    uint32_t    still_s = 0;

    bool        has_position = false;
    double      latitude = 0.0;
    double      longitude = 0.0;

    bool        has_health = false;
    bool        sensors_ok = true;

    bool        has_device_ts = false;
    uint32_t    device_ts_ms = 0;
};

#endif // TELEMETRY_REPORT_HPP
