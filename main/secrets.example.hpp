// Copy to secrets.hpp (git-ignored) and fill in.
#ifndef SECRETS_HPP
#define SECRETS_HPP

namespace Secrets {
    static constexpr const char* WIFI_SSID = "your-ssid";
    static constexpr const char* WIFI_PASSWORD = "your-password";
    static constexpr const char* MQTT_HOST = "192.168.1.10";
    static constexpr int MQTT_PORT = 1883;
    static constexpr const char* DEVICE_ID = "WS_001";
}

#endif // SECRETS_HPP
