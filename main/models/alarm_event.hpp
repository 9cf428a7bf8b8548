#ifndef ALARM_EVENT_HPP
#define ALARM_EVENT_HPP

#include <cstdint>

// Local alarm requests, mapped from the resolved state
enum class AlarmType : uint8_t {
    WARNING   = 0,   // single short beep on entry
    EMERGENCY = 1,   // repeating triple beep
    SOS       = 2,   // repeating SOS pattern
    CLEAR     = 255  // stop any repeating pattern
};

struct AlarmEvent {
    uint32_t  timestamp_ms;
    AlarmType type;
    bool      one_shot;  // play a single round without changing the repeating mode
};

#endif // ALARM_EVENT_HPP
