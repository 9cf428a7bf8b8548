#ifndef CONSOLE_TASK_HPP
#define CONSOLE_TASK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

class WiFiManager;
class MqttClient;

namespace ConsoleTask {
    // Consumer side: subscribes to every wearable's telemetry, serves
    // POST /telemetry, and owns the per-device console picture.
    // report_queue carries TelemetryReport; alarm_queue may be null.
    // Call before MqttClient::start().
    void create(QueueHandle_t report_queue, QueueHandle_t alarm_queue,
                WiFiManager& wifi, MqttClient& mqtt);
}

#endif // CONSOLE_TASK_HPP
