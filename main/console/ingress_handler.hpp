#ifndef INGRESS_HANDLER_HPP
#define INGRESS_HANDLER_HPP

#include <cstdint>
#include <main/models/telemetry_report.hpp>

// Where accepted ingress reports go (the console pipeline)
class IngressSink {
public:
    enum class SubmitResult : uint8_t {
        ACCEPTED = 0,
        UNAVAILABLE,  // pipeline not running or backlog full
        FAILED
    };

    virtual ~IngressSink() = default;
    virtual SubmitResult submit(const TelemetryReport& report) = 0;
};

struct IngressResponse {
    int         status;
    const char* body;
};

namespace IngressHandler {
    // POST /telemetry. A null sink means there is no backing pipeline.
    IngressResponse handle(const char* body, int length, IngressSink* sink);

    IngressResponse payloadTooLarge();
    IngressResponse readFailed();
}

#endif // INGRESS_HANDLER_HPP
