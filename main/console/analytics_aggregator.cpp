#include <main/console/analytics_aggregator.hpp>

void AnalyticsAggregator::onReport(const TelemetryReport& report, DeviceState effective_state) {
    if (report.temperature_valid) {
        temperature_window.push(report.temperature_c);
    }
    if (report.has_motion) {
        motion_window.push(report.moving);
    }
    if (effective_state != DeviceState::OFFLINE) {
        state_window.push(effective_state);
    }
}

TemperatureStats AnalyticsAggregator::temperatureStats() const {
    TemperatureStats stats{};
    stats.count = temperature_window.size();
    if (stats.count == 0) {
        return stats;
    }
    float sum = 0.0f;
    stats.min_c = temperature_window.at(0);
    stats.max_c = temperature_window.at(0);
    for (std::size_t i = 0; i < stats.count; ++i) {
        float t = temperature_window.at(i);
        sum += t;
        if (t < stats.min_c) stats.min_c = t;
        if (t > stats.max_c) stats.max_c = t;
    }
    stats.avg_c = sum / static_cast<float>(stats.count);
    return stats;
}

int AnalyticsAggregator::movingPercent() const {
    std::size_t total = motion_window.size();
    if (total == 0) {
        return 0;
    }
    std::size_t moving = 0;
    for (std::size_t i = 0; i < total; ++i) {
        if (motion_window.at(i)) {
            ++moving;
        }
    }
    // Round half up in integer arithmetic
    return static_cast<int>((moving * 200U + total) / (2U * total));
}

StateBreakdown AnalyticsAggregator::stateBreakdown() const {
    StateBreakdown breakdown{};
    breakdown.total = state_window.size();
    if (breakdown.total == 0) {
        return breakdown;
    }
    std::size_t counts[kReportedStateCount] = {0, 0, 0, 0};
    for (std::size_t i = 0; i < breakdown.total; ++i) {
        std::size_t idx = static_cast<std::size_t>(state_window.at(i));
        if (idx < kReportedStateCount) {
            ++counts[idx];
        }
    }
    for (std::size_t s = 0; s < kReportedStateCount; ++s) {
        breakdown.percent[s] = 100.0f * static_cast<float>(counts[s]) / static_cast<float>(breakdown.total);
    }
    return breakdown;
}
