#include <main/models/device_status.hpp>
#include <cstdio>
#include <cstring>

namespace {
    struct StateName {
        DeviceState state;
        const char* name;
    };

    static constexpr StateName kReportedNames[] = {
        { DeviceState::NORMAL,    "NORMAL" },
        { DeviceState::WARNING,   "WARNING" },
        { DeviceState::EMERGENCY, "EMERGENCY" },
        { DeviceState::SOS,       "SOS" },
    };
}

namespace DeviceStatus {
    const char* toString(DeviceState state) {
        switch (state) {
            case DeviceState::NORMAL:    return "NORMAL";
            case DeviceState::WARNING:   return "WARNING";
            case DeviceState::EMERGENCY: return "EMERGENCY";
            case DeviceState::SOS:       return "SOS";
            case DeviceState::OFFLINE:   return "OFFLINE";
        }
        return "UNKNOWN";
    }

    bool parse(const char* text, DeviceState& out_state) {
        if (text == nullptr) {
            return false;
        }
        while (*text == ' ') {
            ++text;
        }
        for (const StateName& entry : kReportedNames) {
            std::size_t n = std::strlen(entry.name);
            if (std::strncmp(text, entry.name, n) != 0) {
                continue;
            }
            // The base name must end here or be followed by a suffix separator
            char next = text[n];
            if (next == '\0' || next == ' ' || next == '(' || next == ':' || next == '-') {
                out_state = entry.state;
                return true;
            }
        }
        return false;
    }

    void formatCauseSuffix(DeviceState state, uint8_t causes, char* out, std::size_t out_size) {
        if (out_size == 0) {
            return;
        }
        out[0] = '\0';

        bool temp = false;
        bool still = false;
        if (state == DeviceState::EMERGENCY) {
            temp  = (causes & CAUSE_TEMP_CRITICAL) != 0;
            still = (causes & CAUSE_STILL_EMERGENCY) != 0;
        } else if (state == DeviceState::WARNING) {
            temp  = (causes & CAUSE_TEMP_HIGH) != 0;
            still = (causes & CAUSE_STILL_WARNING) != 0;
        }

        if (temp && still) {
            std::snprintf(out, out_size, "%s", "HIGH TEMP + NO MOVEMENT");
        } else if (temp) {
            std::snprintf(out, out_size, "%s", "HIGH TEMP");
        } else if (still) {
            std::snprintf(out, out_size, "%s", "NO MOVEMENT");
        }
    }
}
