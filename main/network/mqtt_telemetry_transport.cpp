#include <main/network/mqtt_telemetry_transport.hpp>
#include <main/config/config.hpp>
#include <cstdio>

MqttTelemetryTransport::MqttTelemetryTransport(WiFiManager& wifi_in, MqttClient& mqtt_in)
    : wifi(wifi_in), mqtt(mqtt_in), last_result(MqttClient::PublishResult::NOT_CONNECTED) {}

bool MqttTelemetryTransport::isAvailable() const {
    // A refused session still gets a delivery attempt so it is counted as rejected
    return wifi.hasIp() && (mqtt.isConnected() || mqtt.connectionRefused());
}

DeliveryOutcome MqttTelemetryTransport::deliver(const char* device_id,
                                                const char* payload,
                                                std::size_t length,
                                                uint32_t timeout_ms) {
    char topic[MqttClient::kTopicMaxLen];
    int n = snprintf(topic, sizeof(topic), Config::Mqtt::Topics::TELEMETRY, device_id);
    if (n <= 0 || static_cast<std::size_t>(n) >= sizeof(topic)) {
        last_result = MqttClient::PublishResult::ENQUEUE_FAILED;
        return DeliveryOutcome::REJECTED;
    }

    last_result = mqtt.publishAndWait(topic, payload, static_cast<int>(length),
                                      Config::Mqtt::telemetry_qos, Config::Mqtt::telemetry_retain,
                                      timeout_ms);
    switch (last_result) {
        case MqttClient::PublishResult::ACKED:
            return DeliveryOutcome::DELIVERED;
        case MqttClient::PublishResult::REFUSED:
            return DeliveryOutcome::REJECTED;
        default:
            return DeliveryOutcome::UNREACHABLE;
    }
}
