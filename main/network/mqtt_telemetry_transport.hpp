#ifndef MQTT_TELEMETRY_TRANSPORT_HPP
#define MQTT_TELEMETRY_TRANSPORT_HPP

#include <main/network/mqtt_client.hpp>
#include <main/network/wifi_manager.hpp>
#include <main/telemetry/telemetry_transport.hpp>

// Carries envelopes to safewear/<id>/telemetry at QoS 1 and waits for
// the PUBACK. A refused broker connection is REJECTED; everything else
// that prevents delivery is UNREACHABLE.
class MqttTelemetryTransport : public TelemetryTransport {
public:
    MqttTelemetryTransport(WiFiManager& wifi, MqttClient& mqtt);

    bool isAvailable() const override;
    DeliveryOutcome deliver(const char* device_id,
                            const char* payload,
                            std::size_t length,
                            uint32_t timeout_ms) override;

    MqttClient::PublishResult lastResult() const { return last_result; }

private:
    WiFiManager& wifi;
    MqttClient& mqtt;
    MqttClient::PublishResult last_result;
};

#endif // MQTT_TELEMETRY_TRANSPORT_HPP
