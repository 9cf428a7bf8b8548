#ifndef ANNOUNCEMENT_GATE_HPP
#define ANNOUNCEMENT_GATE_HPP

#include <cstdint>
#include <main/config/monitoring.hpp>
#include <main/models/device_status.hpp>

// Decides when the console should sound its alarm for one device.
// NORMAL and OFFLINE are never announced; the same state is not repeated
// within the lockout.
class AnnouncementGate {
public:
    explicit AnnouncementGate(uint32_t lockout_ms = Config::Console::announce_lockout_ms)
        : lockout_ms(lockout_ms), last_state(DeviceState::NORMAL), last_ms(0), has_last(false) {}

    bool shouldAnnounce(DeviceState displayed, uint32_t now_ms) {
        if (displayed == DeviceState::NORMAL || displayed == DeviceState::OFFLINE) {
            return false;
        }
        if (has_last && displayed == last_state && (now_ms - last_ms) < lockout_ms) {
            return false;
        }
        last_state = displayed;
        last_ms = now_ms;
        has_last = true;
        return true;
    }

private:
    uint32_t    lockout_ms;
    DeviceState last_state;
    uint32_t    last_ms;
    bool        has_last;
};

#endif // ANNOUNCEMENT_GATE_HPP
