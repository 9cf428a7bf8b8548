#ifndef WIFI_MANAGER_HPP
#define WIFI_MANAGER_HPP

#include <atomic>
#include <cstdint>
#include <esp_wifi.h>
#include <esp_event.h>
#include <esp_netif.h>
#include <esp_timer.h>

// Station-mode WiFi. Reconnection is driven from the event handler:
// a burst of immediate retries, then one attempt per reconnect interval
// from an esp_timer, so no task has to babysit the link.
// NVS must be initialized before init().
class WiFiManager {
public:
    WiFiManager();

    bool init();
    bool connect();
    void disconnect();

    bool isConnected() const { return connected.load(); }
    bool hasIp() const { return got_ip.load(); }

private:
    static void wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);
    static void ipEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);
    static void retryTimerCallback(void* arg);

    void scheduleRetry();

    bool initialized;
    std::atomic<bool> connected;
    std::atomic<bool> got_ip;
    int retry_count;
    bool user_disconnect;

    esp_event_handler_instance_t wifi_any_id_instance;
    esp_event_handler_instance_t ip_got_ip_instance;
    esp_timer_handle_t retry_timer;
};

#endif // WIFI_MANAGER_HPP
