#ifndef RESOLVED_SAMPLE_HPP
#define RESOLVED_SAMPLE_HPP

#include <cstdint>
#include <main/models/device_status.hpp>
#include <main/models/sensor_snapshot.hpp>

// Output of one resolver tick
struct Resolution {
    DeviceState     state = DeviceState::NORMAL;
    uint8_t         causes = CAUSE_NONE;
    SubsystemHealth health{};
    bool            moving = false;
    uint32_t        still_ms = 0;
};

// Latest resolved state plus the raw readings it came from.
// Handed from the sampling task to the publisher task (latest-only).
struct ResolvedSample {
    Resolution     resolution{};
    SensorSnapshot snapshot{};
};

#endif // RESOLVED_SAMPLE_HPP
