#ifndef TELEMETRY_PUBLISHER_HPP
#define TELEMETRY_PUBLISHER_HPP

#include <cstdint>
#include <main/config/monitoring.hpp>
#include <main/models/resolved_sample.hpp>
#include <main/models/telemetry_envelope.hpp>
#include <main/telemetry/telemetry_transport.hpp>

struct PublisherStats {
    uint32_t attempts = 0;
    uint32_t delivered = 0;
    uint32_t rejected = 0;
    uint32_t unreachable = 0;
    uint32_t consecutive_unreachable = 0;
    DeliveryOutcome last_outcome = DeliveryOutcome::UNREACHABLE;
};

// Rate-limited envelope publication. At most one delivery attempt per
// interval; a failed attempt is never retried before the next interval.
class TelemetryPublisher {
public:
    TelemetryPublisher(TelemetryTransport& transport,
                       const char* device_id,
                       uint32_t interval_ms = Config::Telemetry::publish_interval_ms,
                       uint32_t delivery_timeout_ms = Config::Telemetry::delivery_timeout_ms);

    bool isDue(uint32_t now_ms) const;

    // If due, build an envelope from latest and attempt one delivery.
    // Returns false when not due (out_outcome untouched).
    bool tick(const ResolvedSample& latest, uint32_t now_ms, DeliveryOutcome& out_outcome);

    const PublisherStats& stats() const { return counters; }

    static TelemetryEnvelope buildEnvelope(const char* device_id,
                                           const ResolvedSample& sample,
                                           uint32_t now_ms);

private:
    DeliveryOutcome record(DeliveryOutcome outcome);

    TelemetryTransport& transport;
    const char* device_id;
    uint32_t interval_ms;
    uint32_t delivery_timeout_ms;
    uint32_t last_tick_ms;
    bool ticked_once;
    PublisherStats counters;
};

#endif // TELEMETRY_PUBLISHER_HPP
