#ifndef DEVICE_STATUS_HPP
#define DEVICE_STATUS_HPP

#include <cstddef>
#include <cstdint>

// Severity-ordered device state. OFFLINE is a console-side overlay and is
// never produced by the state resolver.
enum class DeviceState : uint8_t {
    NORMAL    = 0,
    WARNING   = 1,
    EMERGENCY = 2,
    SOS       = 3,
    OFFLINE   = 4
};

// Number of states the resolver can produce (NORMAL..SOS)
static constexpr std::size_t kReportedStateCount = 4;

// Which rules contributed to a resolved state
enum CauseFlags : uint8_t {
    CAUSE_NONE            = 0,
    CAUSE_STILL_WARNING   = 1 << 0,
    CAUSE_STILL_EMERGENCY = 1 << 1,
    CAUSE_TEMP_HIGH       = 1 << 2,
    CAUSE_TEMP_CRITICAL   = 1 << 3,
    CAUSE_SOS             = 1 << 4,
};

struct SubsystemHealth {
    bool motion_ok      = true;
    bool environment_ok = true;
    bool position_ok    = true;

    // A missing position fix is not a sensor failure
    bool sensorsOk() const { return motion_ok && environment_ok; }
};

namespace DeviceStatus {
    const char* toString(DeviceState state);

    // Recover the base severity from a wire status such as
    // "EMERGENCY (HIGH TEMP)". OFFLINE is not accepted.
    bool parse(const char* text, DeviceState& out_state);

    inline DeviceState maxSeverity(DeviceState a, DeviceState b) {
        return static_cast<uint8_t>(a) >= static_cast<uint8_t>(b) ? a : b;
    }

    inline bool atLeast(DeviceState state, DeviceState floor) {
        return static_cast<uint8_t>(state) >= static_cast<uint8_t>(floor);
    }

    // Writes "HIGH TEMP", "NO MOVEMENT" or "HIGH TEMP + NO MOVEMENT" for
    // the causes that match the given state's tier. Empty when none apply.
    void formatCauseSuffix(DeviceState state, uint8_t causes, char* out, std::size_t out_size);
}

#endif // DEVICE_STATUS_HPP
