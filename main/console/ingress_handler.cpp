#include <main/console/ingress_handler.hpp>
#include <main/telemetry/envelope_codec.hpp>

namespace {
    constexpr IngressResponse kOk            { 200, "{\"success\":true}" };
    constexpr IngressResponse kInvalidJson   { 400, "{\"error\":\"invalid JSON body\"}" };
    constexpr IngressResponse kMissingId     { 400, "{\"error\":\"device_id is required\"}" };
    constexpr IngressResponse kBadStatus     { 400, "{\"error\":\"unknown status\"}" };
    constexpr IngressResponse kTooLarge      { 400, "{\"error\":\"payload too large\"}" };
    constexpr IngressResponse kUnavailable   { 503, "{\"error\":\"Database service unavailable\"}" };
    constexpr IngressResponse kInternalError { 500, "{\"error\":\"Internal Server Error\"}" };
}

namespace IngressHandler {
    IngressResponse handle(const char* body, int length, IngressSink* sink) {
        if (sink == nullptr) {
            return kUnavailable;
        }

        TelemetryReport report{};
        switch (EnvelopeCodec::decodeIngress(body, length, report)) {
            case EnvelopeCodec::DecodeError::NONE:
                break;
            case EnvelopeCodec::DecodeError::MISSING_DEVICE_ID:
                return kMissingId;
            case EnvelopeCodec::DecodeError::INVALID_STATUS:
                return kBadStatus;
            case EnvelopeCodec::DecodeError::INVALID_JSON:
            default:
                return kInvalidJson;
        }

        switch (sink->submit(report)) {
            case IngressSink::SubmitResult::ACCEPTED:
                return kOk;
            case IngressSink::SubmitResult::UNAVAILABLE:
                return kUnavailable;
            case IngressSink::SubmitResult::FAILED:
            default:
                return kInternalError;
        }
    }

    IngressResponse payloadTooLarge() {
        return kTooLarge;
    }

    IngressResponse readFailed() {
        return kInternalError;
    }
}
