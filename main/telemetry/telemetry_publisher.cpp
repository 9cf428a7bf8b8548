#include <main/telemetry/telemetry_publisher.hpp>
#include <main/telemetry/envelope_codec.hpp>
#include <cstdio>

const char* toString(DeliveryOutcome outcome) {
    switch (outcome) {
        case DeliveryOutcome::DELIVERED:   return "DELIVERED";
        case DeliveryOutcome::REJECTED:    return "REJECTED";
        case DeliveryOutcome::UNREACHABLE: return "UNREACHABLE";
    }
    return "UNKNOWN";
}

TelemetryPublisher::TelemetryPublisher(TelemetryTransport& transport,
                                       const char* device_id,
                                       uint32_t interval_ms,
                                       uint32_t delivery_timeout_ms)
    : transport(transport),
      device_id(device_id),
      interval_ms(interval_ms),
      delivery_timeout_ms(delivery_timeout_ms),
      last_tick_ms(0),
      ticked_once(false) {}

bool TelemetryPublisher::isDue(uint32_t now_ms) const {
    return !ticked_once || (now_ms - last_tick_ms) >= interval_ms;
}

TelemetryEnvelope TelemetryPublisher::buildEnvelope(const char* device_id,
                                                    const ResolvedSample& sample,
                                                    uint32_t now_ms) {
    TelemetryEnvelope env{};
    std::snprintf(env.device_id, sizeof(env.device_id), "%s", device_id != nullptr ? device_id : "");
    env.state = sample.resolution.state;
    env.causes = sample.resolution.causes;
    env.temperature_c = sample.snapshot.temperature_c;
    env.temperature_valid = sample.snapshot.temperature_valid;
    env.total_acc_g = sample.snapshot.motion_valid ? sample.snapshot.total_acc_g : 0.0f;
    env.moving = sample.resolution.moving;
    env.still_ms = sample.resolution.still_ms;
    env.health = sample.resolution.health;
    env.latitude = sample.snapshot.has_fix ? sample.snapshot.latitude : 0.0;
    env.longitude = sample.snapshot.has_fix ? sample.snapshot.longitude : 0.0;
    env.device_ts_ms = now_ms;
    return env;
}

bool TelemetryPublisher::tick(const ResolvedSample& latest, uint32_t now_ms, DeliveryOutcome& out_outcome) {
    if (!isDue(now_ms)) {
        return false;
    }
    // The slot is consumed whatever happens below, so a failure waits a full interval
    last_tick_ms = now_ms;
    ticked_once = true;
    ++counters.attempts;

    if (!transport.isAvailable()) {
        out_outcome = record(DeliveryOutcome::UNREACHABLE);
        return true;
    }

    TelemetryEnvelope env = buildEnvelope(device_id, latest, now_ms);
    char payload[Config::Telemetry::payload_max_len];
    std::size_t len = EnvelopeCodec::encode(env, payload, sizeof(payload));
    if (len == 0) {
        out_outcome = record(DeliveryOutcome::REJECTED);
        return true;
    }

    out_outcome = record(transport.deliver(env.device_id, payload, len, delivery_timeout_ms));
    return true;
}

DeliveryOutcome TelemetryPublisher::record(DeliveryOutcome outcome) {
    counters.last_outcome = outcome;
    switch (outcome) {
        case DeliveryOutcome::DELIVERED:
            ++counters.delivered;
            counters.consecutive_unreachable = 0;
            break;
        case DeliveryOutcome::REJECTED:
            ++counters.rejected;
            counters.consecutive_unreachable = 0;
            break;
        case DeliveryOutcome::UNREACHABLE:
            ++counters.unreachable;
            ++counters.consecutive_unreachable;
            break;
    }
    return outcome;
}
