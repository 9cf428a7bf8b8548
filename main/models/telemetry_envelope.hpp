#ifndef TELEMETRY_ENVELOPE_HPP
#define TELEMETRY_ENVELOPE_HPP

#include <cstdint>
#include <main/config/monitoring.hpp>
#include <main/models/device_status.hpp>

// Wire-level record built once per publish tick. Fixed size so it can be
// copied through queues; never reused after delivery.
struct TelemetryEnvelope {
    char            device_id[Config::Telemetry::device_id_max_len];
    DeviceState     state;
    uint8_t         causes;
    float           temperature_c;
    bool            temperature_valid;
    float           total_acc_g;
    bool            moving;
    uint32_t        still_ms;
    SubsystemHealth health;
    double          latitude;
    double          longitude;
    uint32_t        device_ts_ms;  // device-local, not wall clock
};

#endif // TELEMETRY_ENVELOPE_HPP
