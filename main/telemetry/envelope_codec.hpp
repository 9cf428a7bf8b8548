// JSON wire format for telemetry envelopes and reduced ingress bodies.
// Encoding uses snprintf into caller buffers; decoding uses mjson.
// Neither direction allocates.
#ifndef ENVELOPE_CODEC_HPP
#define ENVELOPE_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/telemetry_envelope.hpp>
#include <main/models/telemetry_report.hpp>

namespace EnvelopeCodec {
    enum class DecodeError : uint8_t {
        NONE = 0,
        INVALID_JSON,
        MISSING_DEVICE_ID,
        INVALID_STATUS
    };

    const char* toString(DecodeError error);

    // Returns bytes written (without terminator), or 0 if the envelope
    // cannot be represented (buffer too small, unsafe device id).
    std::size_t encode(const TelemetryEnvelope& env, char* out, std::size_t out_size);

    // Full device envelope as published over MQTT. status is mandatory.
    DecodeError decodeEnvelope(const char* json, int length, TelemetryReport& out);

    // Reduced ingress body: only device_id is mandatory.
    DecodeError decodeIngress(const char* json, int length, TelemetryReport& out);

    // "MOVING" or "STILL <seconds>s"
    void formatMovement(bool moving, uint32_t still_ms, char* out, std::size_t out_size);
    bool parseMovement(const char* text, bool& moving, uint32_t& still_s);

    // "EMERGENCY (HIGH TEMP)" style status with cause suffix
    void formatStatus(DeviceState state, uint8_t causes, char* out, std::size_t out_size);
}

#endif // ENVELOPE_CODEC_HPP
