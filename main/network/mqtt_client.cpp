#include <main/network/mqtt_client.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <freertos/task.h>
#include <cstring>
#include <cstdio>

static const char* TAG_MQTT = "MqttClient";

namespace {
    constexpr EventBits_t BIT_PUBLISHED    = 1 << 0;
    constexpr EventBits_t BIT_DELETED      = 1 << 1;
    constexpr EventBits_t BIT_DISCONNECTED = 1 << 2;
    constexpr EventBits_t BIT_REFUSED      = 1 << 3;
    constexpr EventBits_t BIT_ALL = BIT_PUBLISHED | BIT_DELETED | BIT_DISCONNECTED | BIT_REFUSED;
}

MqttClient::MqttClient()
    : MqttClient(Config::Mqtt::host, Config::Mqtt::port, Config::Device::id) {}

MqttClient::MqttClient(const char* host_in, int port_in, const char* client_id_in)
    : client(nullptr),
      host(host_in),
      port(port_in),
      client_id(client_id_in),
      connected(false),
      refused(false),
      last_published_mid(-1),
      last_deleted_mid(-1),
      on_message(nullptr),
      on_message_ctx(nullptr),
      events_buffer{},
      events(nullptr),
      wait_lock_buffer{},
      wait_lock(nullptr),
      subscriptions{},
      subscription_count(0),
      uri{},
      lwt_topic{} {}

bool MqttClient::start() {
    if (client != nullptr) {
        return true;
    }
    if (events == nullptr) {
        events = xEventGroupCreateStatic(&events_buffer);
        wait_lock = xSemaphoreCreateMutexStatic(&wait_lock_buffer);
    }

    esp_mqtt_client_config_t cfg = {};
    // esp-mqtt expects a URI with scheme, e.g. "mqtt://host:1883"
    snprintf(uri, sizeof(uri), "mqtt://%s:%d", host, port);
    cfg.broker.address.uri = uri;
    cfg.credentials.client_id = client_id;
    cfg.session.keepalive = Config::Mqtt::keepalive_seconds;
    cfg.session.disable_clean_session = !Config::Mqtt::clean_session;
    cfg.outbox.limit = Config::Mqtt::outbox_limit_bytes;

    // LWT: retained "offline" on ungraceful disconnect; "online" on connect
    if (Config::Mqtt::lwt_enable) {
        snprintf(lwt_topic, sizeof(lwt_topic), Config::Mqtt::Topics::STATUS, client_id);
        cfg.session.last_will.topic = lwt_topic;
        cfg.session.last_will.msg = "offline";
        cfg.session.last_will.qos = Config::Mqtt::telemetry_qos;
        cfg.session.last_will.retain = true;
    }

    LOG_INFO(TAG_MQTT, "Connecting to %s as %s", uri, client_id);

    client = esp_mqtt_client_init(&cfg);
    if (!client) {
        LOG_ERROR(TAG_MQTT, "%s", "esp_mqtt_client_init failed");
        return false;
    }
    esp_err_t err = esp_mqtt_client_register_event(client, MQTT_EVENT_ANY, &MqttClient::mqttEventHandler, this);
    if (err == ESP_OK) {
        err = esp_mqtt_client_start(client);
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG_MQTT, "esp_mqtt_client_start failed: %d", static_cast<int>(err));
        (void)esp_mqtt_client_destroy(client);
        client = nullptr;
        return false;
    }
    return true;
}

void MqttClient::stop() {
    if (client) {
        (void)esp_mqtt_client_stop(client);
        (void)esp_mqtt_client_destroy(client);
        client = nullptr;
        connected = false;
    }
}

int MqttClient::publish(const char* topic, const char* payload, int length, int qos, bool retain) {
    if (!client || !connected) {
        return -1;
    }
    int mid = esp_mqtt_client_publish(client, topic, payload, length, qos, retain ? 1 : 0);
    if (mid >= 0) {
        LOG_DEBUG(TAG_MQTT, "Publish topic=%s len=%d qos=%d mid=%d", topic, length, qos, mid);
    } else {
        LOG_WARN(TAG_MQTT, "Publish failed topic=%s rc=%d", topic, mid);
    }
    return mid;
}

MqttClient::PublishResult MqttClient::publishAndWait(const char* topic, const char* payload, int length,
                                                     int qos, bool retain, uint32_t timeout_ms) {
    if (refused) {
        return PublishResult::REFUSED;
    }
    if (!client || !connected || events == nullptr) {
        return PublishResult::NOT_CONNECTED;
    }
    if (xSemaphoreTake(wait_lock, pdMS_TO_TICKS(timeout_ms)) != pdTRUE) {
        return PublishResult::TIMED_OUT;
    }

    // Clear before publishing so an early PUBACK is not lost
    xEventGroupClearBits(events, BIT_ALL);
    int mid = esp_mqtt_client_publish(client, topic, payload, length, qos, retain ? 1 : 0);
    if (mid < 0) {
        xSemaphoreGive(wait_lock);
        // -2: outbox full, -1: not connected or enqueue failure
        return (mid == -2) ? PublishResult::OUTBOX_FULL : PublishResult::ENQUEUE_FAILED;
    }
    if (qos == 0) {
        xSemaphoreGive(wait_lock);
        return PublishResult::ACKED;
    }

    PublishResult result = PublishResult::TIMED_OUT;
    TickType_t start = xTaskGetTickCount();
    TickType_t wait_ticks = pdMS_TO_TICKS(timeout_ms);
    for (;;) {
        TickType_t elapsed = xTaskGetTickCount() - start;
        if (elapsed >= wait_ticks) {
            break;
        }
        EventBits_t bits = xEventGroupWaitBits(events, BIT_ALL, pdTRUE, pdFALSE, wait_ticks - elapsed);
        if ((bits & BIT_PUBLISHED) && last_published_mid.load() == mid) {
            result = PublishResult::ACKED;
            break;
        }
        if ((bits & BIT_DELETED) && last_deleted_mid.load() == mid) {
            result = PublishResult::DROPPED;
            break;
        }
        if (bits & BIT_REFUSED) {
            result = PublishResult::REFUSED;
            break;
        }
        if (bits & BIT_DISCONNECTED) {
            result = PublishResult::DISCONNECTED;
            break;
        }
    }
    xSemaphoreGive(wait_lock);
    return result;
}

bool MqttClient::subscribe(const char* topic, int qos) {
    for (std::size_t i = 0; i < subscription_count; ++i) {
        if (std::strcmp(subscriptions[i].topic, topic) == 0) {
            return true;
        }
    }
    if (subscription_count >= kMaxSubscriptions || std::strlen(topic) >= kTopicMaxLen) {
        LOG_ERROR(TAG_MQTT, "Cannot track subscription %s", topic);
        return false;
    }
    Subscription& sub = subscriptions[subscription_count++];
    snprintf(sub.topic, sizeof(sub.topic), "%s", topic);
    sub.qos = qos;
    if (client && connected) {
        int mid = esp_mqtt_client_subscribe(client, sub.topic, sub.qos);
        if (mid < 0) {
            LOG_WARN(TAG_MQTT, "Subscribe failed topic=%s rc=%d (will retry on reconnect)", topic, mid);
        }
    }
    return true;
}

void MqttClient::replaySubscriptions() {
    for (std::size_t i = 0; i < subscription_count; ++i) {
        int mid = esp_mqtt_client_subscribe(client, subscriptions[i].topic, subscriptions[i].qos);
        if (mid >= 0) {
            LOG_INFO(TAG_MQTT, "Subscribe topic=%s qos=%d mid=%d", subscriptions[i].topic, subscriptions[i].qos, mid);
        } else {
            LOG_ERROR(TAG_MQTT, "Subscribe failed topic=%s rc=%d", subscriptions[i].topic, mid);
        }
    }
}

void MqttClient::setMessageHandler(MessageHandler handler, void* ctx) {
    on_message = handler;
    on_message_ctx = ctx;
}

const char* MqttClient::toString(PublishResult result) {
    switch (result) {
        case PublishResult::ACKED:          return "acked";
        case PublishResult::NOT_CONNECTED:  return "not connected";
        case PublishResult::OUTBOX_FULL:    return "outbox full";
        case PublishResult::ENQUEUE_FAILED: return "enqueue failed";
        case PublishResult::TIMED_OUT:      return "timed out";
        case PublishResult::DROPPED:        return "dropped";
        case PublishResult::DISCONNECTED:   return "disconnected";
        case PublishResult::REFUSED:        return "refused";
    }
    return "unknown";
}

void MqttClient::mqttEventHandler(void* handler_args, esp_event_base_t, int32_t, void* event_data) {
    auto* self = static_cast<MqttClient*>(handler_args);
    self->handleEvent(static_cast<esp_mqtt_event_handle_t>(event_data));
}

void MqttClient::handleEvent(esp_mqtt_event_handle_t event) {
    switch (event->event_id) {
        case MQTT_EVENT_CONNECTED:
            connected = true;
            refused = false;
            LOG_INFO(TAG_MQTT, "%s", "MQTT connected");
            if (Config::Mqtt::lwt_enable) {
                (void)publish(lwt_topic, "online", 6, Config::Mqtt::telemetry_qos, true);
            }
            replaySubscriptions();
            break;
        case MQTT_EVENT_DISCONNECTED:
            connected = false;
            LOG_WARN(TAG_MQTT, "%s", "MQTT disconnected");
            xEventGroupSetBits(events, BIT_DISCONNECTED);
            break;
        case MQTT_EVENT_PUBLISHED:
            last_published_mid = event->msg_id;
            xEventGroupSetBits(events, BIT_PUBLISHED);
            break;
        case MQTT_EVENT_DELETED:
            last_deleted_mid = event->msg_id;
            LOG_WARN(TAG_MQTT, "Outbox expired mid=%d", event->msg_id);
            xEventGroupSetBits(events, BIT_DELETED);
            break;
        case MQTT_EVENT_DATA:
            // Fragmented messages (current_data_offset > 0) are not supported
            if (event->current_data_offset != 0 || event->data_len != event->total_data_len) {
                LOG_WARN(TAG_MQTT, "Dropping fragmented message (%d bytes)", event->total_data_len);
                break;
            }
            if (on_message) {
                on_message(on_message_ctx, event->topic, event->topic_len, event->data, event->data_len);
            } else {
                LOG_DEBUG(TAG_MQTT, "RX topic=%.*s len=%d", event->topic_len, event->topic, event->data_len);
            }
            break;
        case MQTT_EVENT_ERROR:
            if (event->error_handle &&
                event->error_handle->error_type == MQTT_ERROR_TYPE_CONNECTION_REFUSED) {
                refused = true;
                LOG_ERROR(TAG_MQTT, "Broker refused connection (code %d)",
                          static_cast<int>(event->error_handle->connect_return_code));
                xEventGroupSetBits(events, BIT_REFUSED);
            } else {
                LOG_ERROR(TAG_MQTT, "%s", "MQTT transport error");
            }
            break;
        default:
            break;
    }
}
