#include <main/telemetry/envelope_codec.hpp>
#include <mjson.h>
#include <cfloat>
#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <cstdlib>

namespace {
    bool isSafeIdentifier(const char* id) {
        if (id == nullptr || id[0] == '\0') {
            return false;
        }
        for (const char* p = id; *p != '\0'; ++p) {
            unsigned char c = static_cast<unsigned char>(*p);
            if (c < 0x20 || c == '"' || c == '\\') {
                return false;
            }
        }
        return true;
    }

    bool isJsonObject(const char* json, int length) {
        if (json == nullptr || length <= 0) {
            return false;
        }
        if (mjson(json, length, nullptr, nullptr) <= 0) {
            return false;
        }
        int i = 0;
        while (i < length && (json[i] == ' ' || json[i] == '\t' || json[i] == '\r' || json[i] == '\n')) {
            ++i;
        }
        return i < length && json[i] == '{';
    }

    bool readDeviceId(const char* json, int length, TelemetryReport& out) {
        int n = mjson_get_string(json, length, "$.device_id", out.device_id, sizeof(out.device_id));
        return n > 0;
    }

    uint8_t causesFromSuffix(const char* status, DeviceState state) {
        if (state == DeviceState::SOS) {
            return CAUSE_SOS;
        }
        bool emergency = state == DeviceState::EMERGENCY;
        uint8_t causes = CAUSE_NONE;
        if (std::strstr(status, "HIGH TEMP") != nullptr) {
            causes |= emergency ? CAUSE_TEMP_CRITICAL : CAUSE_TEMP_HIGH;
        }
        if (std::strstr(status, "NO MOVEMENT") != nullptr) {
            causes |= emergency ? CAUSE_STILL_EMERGENCY : CAUSE_STILL_WARNING;
        }
        return causes;
    }

    // Missing status is allowed (has_state stays false); present but
    // unrecognised is an error.
    bool readStatus(const char* json, int length, TelemetryReport& out) {
        const char* tok = nullptr;
        int tok_len = 0;
        int type = mjson_find(json, length, "$.status", &tok, &tok_len);
        if (type == MJSON_TOK_INVALID || type == MJSON_TOK_NULL) {
            return true;
        }
        char status[48];
        if (type != MJSON_TOK_STRING ||
            mjson_get_string(json, length, "$.status", status, sizeof(status)) <= 0) {
            return false;
        }
        if (!DeviceStatus::parse(status, out.state)) {
            return false;
        }
        out.has_state = true;
        out.causes = causesFromSuffix(status, out.state);
        return true;
    }

    void readTemperature(const char* json, int length, TelemetryReport& out) {
        double value = 0.0;
        // Values a float cannot hold are treated as a broken reading
        if (mjson_get_number(json, length, "$.temperature", &value) == 1 &&
            std::isfinite(value) && std::fabs(value) <= static_cast<double>(FLT_MAX)) {
            out.temperature_c = static_cast<float>(value);
            out.temperature_valid = true;
        }
    }

    void readMovement(const char* json, int length, TelemetryReport& out) {
        char movement[32];
        if (mjson_get_string(json, length, "$.movement", movement, sizeof(movement)) > 0) {
            out.has_motion = EnvelopeCodec::parseMovement(movement, out.moving, out.still_s);
        }
    }

    void readPosition(const char* json, int length, TelemetryReport& out) {
        double lat = 0.0;
        double lon = 0.0;
        if (mjson_get_number(json, length, "$.latitude", &lat) == 1 &&
            mjson_get_number(json, length, "$.longitude", &lon) == 1) {
            out.latitude = lat;
            out.longitude = lon;
            out.has_position = true;
        }
    }

    bool statusIs(const char* json, int length, const char* path, const char* expected) {
        char value[24];
        if (mjson_get_string(json, length, path, value, sizeof(value)) <= 0) {
            return false;
        }
        return std::strcmp(value, expected) == 0;
    }
}

namespace EnvelopeCodec {
    const char* toString(DecodeError error) {
        switch (error) {
            case DecodeError::NONE:              return "ok";
            case DecodeError::INVALID_JSON:      return "invalid JSON body";
            case DecodeError::MISSING_DEVICE_ID: return "device_id is required";
            case DecodeError::INVALID_STATUS:    return "unknown status";
        }
        return "unknown error";
    }

    void formatMovement(bool moving, uint32_t still_ms, char* out, std::size_t out_size) {
        if (moving) {
            std::snprintf(out, out_size, "%s", "MOVING");
        } else {
            std::snprintf(out, out_size, "STILL %" PRIu32 "s", still_ms / 1000U);
        }
    }

    bool parseMovement(const char* text, bool& moving, uint32_t& still_s) {
        if (text == nullptr) {
            return false;
        }
        if (std::strncmp(text, "MOVING", 6) == 0) {
            moving = true;
            still_s = 0;
            return true;
        }
        if (std::strncmp(text, "STILL", 5) == 0) {
            moving = false;
            still_s = static_cast<uint32_t>(std::strtoul(text + 5, nullptr, 10));
            return true;
        }
        return false;
    }

    void formatStatus(DeviceState state, uint8_t causes, char* out, std::size_t out_size) {
        char suffix[32];
        DeviceStatus::formatCauseSuffix(state, causes, suffix, sizeof(suffix));
        if (suffix[0] != '\0') {
            std::snprintf(out, out_size, "%s (%s)", DeviceStatus::toString(state), suffix);
        } else {
            std::snprintf(out, out_size, "%s", DeviceStatus::toString(state));
        }
    }

    std::size_t encode(const TelemetryEnvelope& env, char* out, std::size_t out_size) {
        if (out == nullptr || out_size == 0 || !isSafeIdentifier(env.device_id) ||
            env.state == DeviceState::OFFLINE) {
            return 0;
        }

        char status[48];
        formatStatus(env.state, env.causes, status, sizeof(status));
        char movement[24];
        formatMovement(env.moving, env.still_ms, movement, sizeof(movement));
        char temperature[16];
        if (env.temperature_valid) {
            std::snprintf(temperature, sizeof(temperature), "%.2f", static_cast<double>(env.temperature_c));
        } else {
            std::snprintf(temperature, sizeof(temperature), "%s", "null");
        }

        int n = std::snprintf(out, out_size,
                              "{\"device_id\":\"%s\",\"status\":\"%s\",\"temperature\":%s,"
                              "\"total_acc\":%.2f,\"movement\":\"%s\","
                              "\"mpu_status\":\"%s\",\"dht_status\":\"%s\",\"gps_status\":\"%s\","
                              "\"system_status\":\"%s\",\"latitude\":%.6f,\"longitude\":%.6f,"
                              "\"timestamp\":%" PRIu32 "}",
                              env.device_id, status, temperature,
                              static_cast<double>(env.total_acc_g), movement,
                              env.health.motion_ok ? "OK" : "ERROR",
                              env.health.environment_ok ? "OK" : "ERROR",
                              env.health.position_ok ? "OK" : "NO_SIGNAL",
                              env.health.sensorsOk() ? "OK" : "SENSOR_FAILURE",
                              env.latitude, env.longitude,
                              env.device_ts_ms);
        if (n < 0 || static_cast<std::size_t>(n) >= out_size) {
            out[0] = '\0';
            return 0;
        }
        return static_cast<std::size_t>(n);
    }

    DecodeError decodeIngress(const char* json, int length, TelemetryReport& out) {
        out = TelemetryReport{};
        if (!isJsonObject(json, length)) {
            return DecodeError::INVALID_JSON;
        }
        if (!readDeviceId(json, length, out)) {
            return DecodeError::MISSING_DEVICE_ID;
        }
        if (!readStatus(json, length, out)) {
            return DecodeError::INVALID_STATUS;
        }
        readTemperature(json, length, out);
        readMovement(json, length, out);
        readPosition(json, length, out);
        return DecodeError::NONE;
    }

    DecodeError decodeEnvelope(const char* json, int length, TelemetryReport& out) {
        DecodeError err = decodeIngress(json, length, out);
        if (err != DecodeError::NONE) {
            return err;
        }
        if (!out.has_state) {
            return DecodeError::INVALID_STATUS;
        }

        // Without a fix the coordinates are placeholders
        if (out.has_position && !statusIs(json, length, "$.gps_status", "OK")) {
            out.has_position = false;
        }

        char system_status[24];
        if (mjson_get_string(json, length, "$.system_status", system_status, sizeof(system_status)) > 0) {
            out.has_health = true;
            out.sensors_ok = std::strcmp(system_status, "OK") == 0;
        }

        double ts = 0.0;
        // Only device-local uptime fits; wall-clock epochs are ignored
        if (mjson_get_number(json, length, "$.timestamp", &ts) == 1 &&
            ts >= 0.0 && ts <= static_cast<double>(UINT32_MAX)) {
            out.device_ts_ms = static_cast<uint32_t>(ts);
            out.has_device_ts = true;
        }
        return DecodeError::NONE;
    }
}
