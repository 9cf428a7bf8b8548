#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <main/secrets.hpp>
#include <main/config/monitoring.hpp>
#include <driver/gpio.h>
#include <driver/uart.h>
#include <hal/adc_types.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace Config {
namespace Wifi {
    // Network credentials sourced from secrets.hpp (git-ignored)
    static constexpr const char* ssid = Secrets::WIFI_SSID;
    static constexpr const char* password = Secrets::WIFI_PASSWORD;

    static constexpr bool auto_connect_on_start = true;
    static constexpr int max_retry_count = 5;             // immediate retries before the reconnect timer takes over
    static constexpr uint32_t reconnect_interval_ms = 15000;
}

namespace Device {
    static constexpr const char* id = Secrets::DEVICE_ID;
}

namespace Hardware {
namespace Pins {
    // SOS push button, active low with internal pull-up
    static constexpr gpio_num_t sos_button_gpio = GPIO_NUM_27;
    // Piezo buzzer for local alerting
    static constexpr gpio_num_t buzzer_gpio = GPIO_NUM_26;
    // LM35 ambient sensor on ADC1_CH0 (input-only pin)
    static constexpr gpio_num_t temp_sensor_gpio = GPIO_NUM_36;
} // namespace Pins

namespace Motion {
    // MPU-6050 on the primary I2C bus
    static constexpr int i2c_port = 0; // I2C_NUM_0
    static constexpr gpio_num_t sda = GPIO_NUM_21;
    static constexpr gpio_num_t scl = GPIO_NUM_22;
    static constexpr uint32_t clk_hz = 400000;
    static constexpr uint8_t address = 0x68;
    static constexpr uint32_t io_timeout_ms = 20;
}

namespace Temperature {
    // Gain (C per mV); LM35 is 10 mV/C
    static constexpr float gain_c_per_mv = 0.1f;
    // Readings outside the sensor's rated range are treated as invalid
    static constexpr float valid_min_c = -40.0f;
    static constexpr float valid_max_c = 125.0f;
}

namespace Gps {
    static constexpr uart_port_t uart = UART_NUM_2;
    static constexpr gpio_num_t rx = GPIO_NUM_16;
    static constexpr gpio_num_t tx = GPIO_NUM_17;
    static constexpr int baud = 9600;
    static constexpr int rx_buffer_size = 1024;
    // A fix older than this is reported as NO_SIGNAL
    static constexpr uint32_t fix_max_age_ms = 5000;
}
}

namespace Tasks {
namespace Sampling {
    static constexpr uint32_t period_ms = 50;
    // The ambient sensor is read less often than the IMU
    static constexpr uint32_t temperature_period_ms = 2000;
    static constexpr uint32_t temperature_max_age_ms = 5000;
}
namespace Telemetry {
    static constexpr uint32_t loop_period_ms = 100;
    static constexpr uint32_t unreachable_log_interval_ms = 30000;
}
namespace Console {
    static constexpr uint32_t tick_period_ms = 500;
    static constexpr uint32_t summary_period_ms = 30000;
    static constexpr UBaseType_t report_queue_length = 16;
}
namespace Watchdog {
    static constexpr uint32_t timeout_ms = 8000;
}
}

// Feature toggles: which role(s) this image runs
namespace Features {
    static constexpr bool enable_wearable_role = true;
    static constexpr bool enable_alarm_task    = true;
    static constexpr bool enable_console_role  = false;
}

// Task priority levels (higher number = higher priority, can preempt lower)
namespace TaskPriorities {
    // Local alarm must preempt everything else
    static constexpr UBaseType_t CRITICAL = tskIDLE_PRIORITY + 3;

    // Sampling loop and SOS debounce need a steady cadence
    static constexpr UBaseType_t HIGH     = tskIDLE_PRIORITY + 2;

    // Network I/O and console bookkeeping tolerate latency
    static constexpr UBaseType_t NORMAL   = tskIDLE_PRIORITY + 1;
}

namespace Mqtt {
    // Broker endpoint (from secrets)
    static constexpr const char* host = Secrets::MQTT_HOST;
    static constexpr int port = Secrets::MQTT_PORT;

    static constexpr bool clean_session = true;
    static constexpr uint16_t keepalive_seconds = 30;
    static constexpr int telemetry_qos = 1;
    static constexpr bool telemetry_retain = false;
    // esp-mqtt outbox cap; publishing beyond it is reported as unreachable
    static constexpr int outbox_limit_bytes = 4096;

    // LWT: retained "offline" on the status topic
    static constexpr bool lwt_enable = true;

    namespace Topics {
        static constexpr const char* TELEMETRY = "safewear/%s/telemetry";
        static constexpr const char* STATUS = "safewear/%s/status";
        // Console subscription
        static constexpr const char* TELEMETRY_ALL = "safewear/+/telemetry";
    }
}

namespace Http {
    static constexpr uint16_t port = 80;
    static constexpr const char* telemetry_uri = "/telemetry";
}

namespace TimeSync {
    static constexpr const char* primary_server = "pool.ntp.org";
    static constexpr const char* secondary_server = "time.google.com";
}
}

#endif // CONFIG_HPP
