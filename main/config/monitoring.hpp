// Compile-time safety limits shared by the firmware and the host tests.
// Kept free of ESP-IDF headers so the portable pipeline can include it.
#ifndef MONITORING_CONFIG_HPP
#define MONITORING_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace Config {
namespace Monitoring {
    // Movement: |total_acc - 1 g| above this counts as movement
    static constexpr float    movement_threshold_g = 0.15f;

    // Stillness escalation (single-tier policy)
    static constexpr uint32_t still_warning_ms   = 5000;
    static constexpr uint32_t still_emergency_ms = 15000;

    // Ambient temperature thresholds (Celsius)
    static constexpr float temp_warning_c  = 40.0f;
    static constexpr float temp_critical_c = 50.0f;

    // SOS button
    static constexpr uint32_t sos_debounce_ms = 200;
    static constexpr uint8_t  sos_deactivation_presses = 2;
}

namespace Telemetry {
    static constexpr uint32_t publish_interval_ms = 3000;
    // Upper bound for one delivery attempt (broker ack wait)
    static constexpr uint32_t delivery_timeout_ms = 2000;
    static constexpr std::size_t payload_max_len = 384;
    static constexpr std::size_t device_id_max_len = 32;
}

namespace Console {
    static constexpr uint32_t liveness_timeout_ms = 10000;
    static constexpr std::size_t max_devices = 8;
    static constexpr std::size_t analytics_window = 60;
    static constexpr std::size_t alert_log_capacity = 20;
    static constexpr std::size_t trail_capacity = 50;
    static constexpr double   trail_min_step_deg = 0.0001;
    static constexpr uint32_t announce_lockout_ms = 10000;
    static constexpr std::size_t ingress_body_max_len = 512;
}
}

#endif // MONITORING_CONFIG_HPP
