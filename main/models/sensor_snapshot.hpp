#ifndef SENSOR_SNAPSHOT_HPP
#define SENSOR_SNAPSHOT_HPP

#include <cstdint>

// One evaluation tick worth of readings. Each reading carries its own
// validity; invalid values are never replaced with plausible defaults.
struct SensorSnapshot {
    float    acc_deviation_g = 0.0f;  // signed |a| - 1 g
    float    total_acc_g     = 0.0f;  // raw magnitude
    bool     motion_valid    = false;

    float    temperature_c     = 0.0f;
    bool     temperature_valid = false;

    double   latitude  = 0.0;
    double   longitude = 0.0;
    bool     has_fix   = false;

    bool     sos_released = false;    // debounced separately by SosLatch
    uint32_t ts_ms = 0;
};

#endif // SENSOR_SNAPSHOT_HPP
