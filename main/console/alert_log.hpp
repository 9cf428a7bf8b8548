#ifndef ALERT_LOG_HPP
#define ALERT_LOG_HPP

#include <cstddef>
#include <cstdint>
#include <main/config/monitoring.hpp>
#include <main/models/device_status.hpp>
#include <main/utils/rolling_window.hpp>

struct AlertLogEntry {
    uint32_t    receipt_ms;
    char        clock[16];   // "HH:MM:SS" once the console clock is synced, else empty
    char        device_id[Config::Telemetry::device_id_max_len];
    DeviceState state;
    char        cause[40];
};

// Bounded alert history; the oldest entry is dropped once full.
class AlertLog {
public:
    void append(uint32_t receipt_ms, const char* clock, const char* device_id,
                DeviceState state, const char* cause);

    std::size_t size() const { return entries.size(); }
    // Entries ever appended, including the ones since evicted
    uint32_t appendedCount() const { return appended; }
    bool isEmpty() const { return entries.isEmpty(); }

    // 0 is the most recent entry
    const AlertLogEntry& newestFirst(std::size_t index) const {
        return entries.at(entries.size() - 1U - index);
    }

private:
    RollingWindow<AlertLogEntry, Config::Console::alert_log_capacity> entries;
    uint32_t appended = 0;
};

#endif // ALERT_LOG_HPP
