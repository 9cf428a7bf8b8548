#ifndef TELEMETRY_TRANSPORT_HPP
#define TELEMETRY_TRANSPORT_HPP

#include <cstddef>
#include <cstdint>

enum class DeliveryOutcome : uint8_t {
    DELIVERED   = 0,  // remote acknowledged
    REJECTED    = 1,  // remote refused or envelope unusable; do not retry
    UNREACHABLE = 2   // no connectivity or timed out; retry on next tick
};

const char* toString(DeliveryOutcome outcome);

// Seam between the publisher and whatever carries envelopes off the device
class TelemetryTransport {
public:
    virtual ~TelemetryTransport() = default;

    // Cheap connectivity check; must not block
    virtual bool isAvailable() const = 0;

    // One bounded delivery attempt. Must return within timeout_ms.
    virtual DeliveryOutcome deliver(const char* device_id,
                                    const char* payload,
                                    std::size_t length,
                                    uint32_t timeout_ms) = 0;
};

#endif // TELEMETRY_TRANSPORT_HPP
