#ifndef MQTT_CLIENT_HPP
#define MQTT_CLIENT_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mqtt_client.h>
#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>
#include <freertos/semphr.h>

// esp-mqtt wrapper. The client is started once and esp-mqtt handles
// reconnection; subscriptions are replayed on every (re)connect.
class MqttClient {
public:
    // payload is not null-terminated
    using MessageHandler = void (*)(void* ctx, const char* topic, int topic_len,
                                    const char* payload, int length);

    enum class PublishResult : uint8_t {
        ACKED,          // PUBACK received (or sent, for QoS 0)
        NOT_CONNECTED,
        OUTBOX_FULL,
        ENQUEUE_FAILED,
        TIMED_OUT,
        DROPPED,        // expired from the outbox before delivery
        DISCONNECTED,   // link lost while waiting
        REFUSED         // broker refused the connection
    };

    static constexpr std::size_t kMaxSubscriptions = 4;
    static constexpr std::size_t kTopicMaxLen = 96;

    MqttClient();
    MqttClient(const char* host, int port, const char* client_id);

    bool start();
    void stop();
    bool isConnected() const { return connected.load(); }
    // True after the broker answered CONNACK with a refusal; cleared on connect
    bool connectionRefused() const { return refused.load(); }

    int publish(const char* topic, const char* payload, int length, int qos, bool retain);

    // Publish and block until the broker acknowledges or timeout_ms passes.
    // One waiter at a time.
    PublishResult publishAndWait(const char* topic, const char* payload, int length,
                                 int qos, bool retain, uint32_t timeout_ms);

    // Remembered and re-sent on reconnect
    bool subscribe(const char* topic, int qos);

    void setMessageHandler(MessageHandler handler, void* ctx);

    static const char* toString(PublishResult result);

private:
    static void mqttEventHandler(void* handler_args, esp_event_base_t base, int32_t event_id, void* event_data);
    void handleEvent(esp_mqtt_event_handle_t event);
    void replaySubscriptions();

    struct Subscription {
        char topic[kTopicMaxLen];
        int  qos;
    };

    esp_mqtt_client_handle_t client;
    const char* host;
    int port;
    const char* client_id;
    std::atomic<bool> connected;
    std::atomic<bool> refused;
    std::atomic<int> last_published_mid;
    std::atomic<int> last_deleted_mid;
    MessageHandler on_message;
    void* on_message_ctx;

    StaticEventGroup_t events_buffer;
    EventGroupHandle_t events;
    StaticSemaphore_t wait_lock_buffer;
    SemaphoreHandle_t wait_lock;

    Subscription subscriptions[kMaxSubscriptions];
    std::size_t subscription_count;
    char uri[128];
    char lwt_topic[kTopicMaxLen];
};

#endif // MQTT_CLIENT_HPP
