#include <main/console/alert_log.hpp>
#include <cstdio>

void AlertLog::append(uint32_t receipt_ms, const char* clock, const char* device_id,
                      DeviceState state, const char* cause) {
    AlertLogEntry entry{};
    entry.receipt_ms = receipt_ms;
    std::snprintf(entry.clock, sizeof(entry.clock), "%s", clock != nullptr ? clock : "");
    std::snprintf(entry.device_id, sizeof(entry.device_id), "%s", device_id != nullptr ? device_id : "");
    entry.state = state;
    std::snprintf(entry.cause, sizeof(entry.cause), "%s", cause != nullptr ? cause : "");
    entries.push(entry);
    ++appended;
}
