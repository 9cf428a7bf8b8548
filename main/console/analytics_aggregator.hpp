#ifndef ANALYTICS_AGGREGATOR_HPP
#define ANALYTICS_AGGREGATOR_HPP

#include <cstddef>
#include <cstdint>
#include <main/config/monitoring.hpp>
#include <main/models/device_status.hpp>
#include <main/models/telemetry_report.hpp>
#include <main/utils/rolling_window.hpp>

struct TemperatureStats {
    std::size_t count = 0;
    float min_c = 0.0f;
    float avg_c = 0.0f;
    float max_c = 0.0f;
};

struct StateBreakdown {
    std::size_t total = 0;
    float percent[kReportedStateCount] = {0.0f, 0.0f, 0.0f, 0.0f};  // indexed by DeviceState
};

// Rolling trend windows for one device. Every derived value is computed
// from the current window contents on demand.
class AnalyticsAggregator {
public:
    static constexpr std::size_t kWindow = Config::Console::analytics_window;

    // Push whatever the report carries; missing or invalid values are skipped.
    void onReport(const TelemetryReport& report, DeviceState effective_state);

    TemperatureStats temperatureStats() const;

    // Share of "moving" samples, rounded to a whole percent; 0 when empty
    int movingPercent() const;

    StateBreakdown stateBreakdown() const;

    const RollingWindow<float, kWindow>& temperatures() const { return temperature_window; }
    const RollingWindow<bool, kWindow>& movement() const { return motion_window; }
    const RollingWindow<DeviceState, kWindow>& states() const { return state_window; }

private:
    RollingWindow<float, kWindow> temperature_window;
    RollingWindow<bool, kWindow> motion_window;
    RollingWindow<DeviceState, kWindow> state_window;
};

#endif // ANALYTICS_AGGREGATOR_HPP
