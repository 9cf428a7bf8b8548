#ifndef TELEMETRY_TASK_HPP
#define TELEMETRY_TASK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

class WiFiManager;
class MqttClient;

namespace TelemetryTask {
    // Publishes the latest ResolvedSample (read from latest_sample_queue)
    // as an envelope every publish interval.
    void create(QueueHandle_t latest_sample_queue, WiFiManager& wifi, MqttClient& mqtt);
}

#endif // TELEMETRY_TASK_HPP
