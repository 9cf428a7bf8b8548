#include <main/network/wifi_manager.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>

#include <esp_err.h>
#include <cstdio>

static const char* TAG = "WiFiManager";

WiFiManager::WiFiManager()
    : initialized(false),
      connected(false),
      got_ip(false),
      retry_count(0),
      user_disconnect(false),
      wifi_any_id_instance(nullptr),
      ip_got_ip_instance(nullptr),
      retry_timer(nullptr) {}

bool WiFiManager::init() {
    if (initialized) {
        return true;
    }

    ESP_ERROR_CHECK(esp_netif_init());
    esp_err_t loop_err = esp_event_loop_create_default();
    if (loop_err != ESP_OK && loop_err != ESP_ERR_INVALID_STATE) {
        LOG_ERROR(TAG, "Event loop create failed: %d", static_cast<int>(loop_err));
        return false;
    }

    esp_netif_create_default_wifi_sta();

    wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
    ESP_ERROR_CHECK(esp_wifi_init(&cfg));

    ESP_ERROR_CHECK(esp_event_handler_instance_register(
        WIFI_EVENT, ESP_EVENT_ANY_ID, &WiFiManager::wifiEventHandler, this, &wifi_any_id_instance));
    ESP_ERROR_CHECK(esp_event_handler_instance_register(
        IP_EVENT, IP_EVENT_STA_GOT_IP, &WiFiManager::ipEventHandler, this, &ip_got_ip_instance));

    esp_timer_create_args_t timer_args = {};
    timer_args.callback = &WiFiManager::retryTimerCallback;
    timer_args.arg = this;
    timer_args.dispatch_method = ESP_TIMER_TASK;
    timer_args.name = "wifi_retry";
    esp_err_t err = esp_timer_create(&timer_args, &retry_timer);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "Retry timer create failed: %d", static_cast<int>(err));
        return false;
    }

    ESP_ERROR_CHECK(esp_wifi_set_mode(WIFI_MODE_STA));

    wifi_config_t wifi_config = {};
    snprintf(reinterpret_cast<char*>(wifi_config.sta.ssid),
             sizeof(wifi_config.sta.ssid), "%s", Config::Wifi::ssid);
    snprintf(reinterpret_cast<char*>(wifi_config.sta.password),
             sizeof(wifi_config.sta.password), "%s", Config::Wifi::password);
    wifi_config.sta.threshold.authmode = WIFI_AUTH_WPA2_PSK;
    wifi_config.sta.sae_pwe_h2e = WPA3_SAE_PWE_BOTH;
    wifi_config.sta.pmf_cfg.capable = true;
    wifi_config.sta.pmf_cfg.required = false;

    ESP_ERROR_CHECK(esp_wifi_set_config(WIFI_IF_STA, &wifi_config));
    // STA_START triggers the first connect when auto-connect is on
    ESP_ERROR_CHECK(esp_wifi_start());

    initialized = true;
    return true;
}

bool WiFiManager::connect() {
    if (!initialized && !init()) {
        return false;
    }
    user_disconnect = false;
    retry_count = 0;
    esp_err_t err = esp_wifi_connect();
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_wifi_connect failed: %d", static_cast<int>(err));
        return false;
    }
    LOG_INFO(TAG, "Connecting to SSID: %s", Config::Wifi::ssid);
    return true;
}

void WiFiManager::disconnect() {
    user_disconnect = true;
    if (retry_timer) {
        (void)esp_timer_stop(retry_timer);
    }
    esp_err_t err = esp_wifi_disconnect();
    if (err != ESP_OK) {
        LOG_WARN(TAG, "esp_wifi_disconnect: %d", static_cast<int>(err));
    }
    connected = false;
    got_ip = false;
}

void WiFiManager::scheduleRetry() {
    if (retry_timer == nullptr || esp_timer_is_active(retry_timer)) {
        return;
    }
    esp_err_t err = esp_timer_start_once(retry_timer,
                                         static_cast<uint64_t>(Config::Wifi::reconnect_interval_ms) * 1000ULL);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "Retry timer start failed: %d", static_cast<int>(err));
    }
}

void WiFiManager::retryTimerCallback(void* arg) {
    WiFiManager* self = static_cast<WiFiManager*>(arg);
    if (self->user_disconnect || self->got_ip) {
        return;
    }
    self->retry_count = 0;
    LOG_INFO(TAG, "%s", "Periodic WiFi reconnect attempt");
    if (esp_wifi_connect() != ESP_OK) {
        self->scheduleRetry();
    }
}

void WiFiManager::wifiEventHandler(void* arg, esp_event_base_t, int32_t event_id, void*) {
    WiFiManager* self = static_cast<WiFiManager*>(arg);
    switch (event_id) {
        case WIFI_EVENT_STA_START:
            LOG_INFO(TAG, "%s", "WIFI_EVENT_STA_START");
            if (Config::Wifi::auto_connect_on_start) {
                (void)esp_wifi_connect();
            }
            break;
        case WIFI_EVENT_STA_CONNECTED:
            LOG_INFO(TAG, "%s", "WIFI_EVENT_STA_CONNECTED");
            self->connected = true;
            break;
        case WIFI_EVENT_STA_DISCONNECTED:
            self->connected = false;
            self->got_ip = false;
            if (self->user_disconnect) {
                break;
            }
            if (self->retry_count < Config::Wifi::max_retry_count) {
                self->retry_count++;
                LOG_WARN(TAG, "WiFi disconnected, retry %d/%d", self->retry_count, Config::Wifi::max_retry_count);
                (void)esp_wifi_connect();
            } else {
                LOG_ERROR(TAG, "WiFi connect failed after %d retries, next attempt in %lu ms",
                          Config::Wifi::max_retry_count,
                          static_cast<unsigned long>(Config::Wifi::reconnect_interval_ms));
                self->scheduleRetry();
            }
            break;
        case WIFI_EVENT_STA_STOP:
            LOG_INFO(TAG, "%s", "WIFI_EVENT_STA_STOP");
            self->connected = false;
            self->got_ip = false;
            break;
        default:
            break;
    }
}

void WiFiManager::ipEventHandler(void* arg, esp_event_base_t, int32_t event_id, void*) {
    WiFiManager* self = static_cast<WiFiManager*>(arg);
    if (event_id == IP_EVENT_STA_GOT_IP) {
        self->got_ip = true;
        self->connected = true;
        self->retry_count = 0;
        LOG_INFO(TAG, "%s", "Got IP address");
    }
}
