#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <nvs_flash.h>
#include <main/config/config.hpp>
#include <main/models/alarm_event.hpp>
#include <main/models/resolved_sample.hpp>
#include <main/models/telemetry_report.hpp>
#include <main/network/mqtt_client.hpp>
#include <main/network/wifi_manager.hpp>
#include <main/tasks/alarm_control_task.hpp>
#include <main/tasks/console_task.hpp>
#include <main/tasks/safety_monitor_task.hpp>
#include <main/tasks/telemetry_task.hpp>
#include <main/utils/logger.hpp>
#include <main/utils/watchdog.hpp>

extern "C" void app_main(void)
{
    Logger::init(LogLevel::INFO);
    LOG_INFO("MAIN", "---SafeWear %s started---", Config::Device::id);

    // NVS is required by the WiFi driver
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        err = nvs_flash_init();
    }
    ESP_ERROR_CHECK(err);

    Watchdog::init();

    // Static queues
    static uint8_t alarm_queue_storage[8 * sizeof(AlarmEvent)];
    static StaticQueue_t alarm_queue_tcb;
    QueueHandle_t alarm_queue = xQueueCreateStatic(
        8, sizeof(AlarmEvent), alarm_queue_storage, &alarm_queue_tcb);

    // Latest-only handoff from the sampling loop to the publisher
    static uint8_t latest_sample_storage[1 * sizeof(ResolvedSample)];
    static StaticQueue_t latest_sample_tcb;
    QueueHandle_t latest_sample_queue = xQueueCreateStatic(
        1, sizeof(ResolvedSample), latest_sample_storage, &latest_sample_tcb);

    static uint8_t report_queue_storage[Config::Tasks::Console::report_queue_length * sizeof(TelemetryReport)];
    static StaticQueue_t report_queue_tcb;
    QueueHandle_t report_queue = xQueueCreateStatic(
        Config::Tasks::Console::report_queue_length, sizeof(TelemetryReport),
        report_queue_storage, &report_queue_tcb);

    static WiFiManager wifi;
    static MqttClient mqtt;

    // The sampling loop runs even without a network
    if (Config::Features::enable_alarm_task) {
        AlarmControlTask::create(alarm_queue, Config::Hardware::Pins::buzzer_gpio,
                                 Config::Features::enable_wearable_role);
    }
    if (Config::Features::enable_wearable_role) {
        SafetyMonitorTask::create(Config::Features::enable_alarm_task ? alarm_queue : nullptr,
                                  latest_sample_queue);
    }

    if (!wifi.init()) {
        LOG_ERROR("MAIN", "%s", "WiFi init failed; running offline");
    } else {
        if (Config::Features::enable_console_role) {
            ConsoleTask::create(report_queue,
                                Config::Features::enable_alarm_task ? alarm_queue : nullptr,
                                wifi, mqtt);
        }
        // esp-mqtt keeps retrying until the network comes up
        if (!mqtt.start()) {
            LOG_ERROR("MAIN", "%s", "MQTT client start failed");
        }
        if (Config::Features::enable_wearable_role) {
            TelemetryTask::create(latest_sample_queue, wifi, mqtt);
        }
    }

    for (;;) {
        vTaskDelay(portMAX_DELAY);
    }
}
