#include <main/tasks/telemetry_task.hpp>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <main/config/config.hpp>
#include <main/models/resolved_sample.hpp>
#include <main/network/mqtt_client.hpp>
#include <main/network/mqtt_telemetry_transport.hpp>
#include <main/network/wifi_manager.hpp>
#include <main/telemetry/telemetry_publisher.hpp>
#include <main/utils/logger.hpp>
#include <main/utils/watchdog.hpp>

namespace {
    static const char* TAG = "TELEMETRY";

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[6144 / sizeof(StackType_t)];

    static QueueHandle_t q_latest = nullptr;
    static MqttTelemetryTransport* s_transport = nullptr;

    static constexpr uint32_t kStatsLogPeriodMs = 60000;

    static inline uint32_t nowMs() {
        return static_cast<uint32_t>(xTaskGetTickCount() * portTICK_PERIOD_MS);
    }

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Telemetry Task started");
        Watchdog::subscribe("telemetry");

        TelemetryPublisher publisher(*s_transport, Config::Device::id);
        ResolvedSample latest{};
        bool have_sample = false;

        uint32_t last_unreachable_log = 0;
        bool unreachable_log_primed = false;
        uint32_t last_stats_log = 0;
        bool stats_log_primed = false;

        for (;;) {
            Watchdog::feed();

            // Latest-only handoff: peek keeps the value for the next tick
            if (q_latest && xQueuePeek(q_latest, &latest, 0) == pdTRUE) {
                have_sample = true;
            }

            uint32_t now = nowMs();
            DeliveryOutcome outcome;
            uint32_t unreachable_before = publisher.stats().consecutive_unreachable;
            if (have_sample && publisher.tick(latest, now, outcome)) {
                const PublisherStats& st = publisher.stats();
                switch (outcome) {
                    case DeliveryOutcome::DELIVERED:
                        if (unreachable_before > 0) {
                            LOG_INFO(TAG, "Delivery resumed after %lu failed attempts",
                                     static_cast<unsigned long>(unreachable_before));
                        }
                        LOG_DEBUG(TAG, "Envelope delivered (%s)", DeviceStatus::toString(latest.resolution.state));
                        break;
                    case DeliveryOutcome::REJECTED:
                        LOG_WARN(TAG, "Envelope rejected (%s), rejected=%lu",
                                 MqttClient::toString(s_transport->lastResult()),
                                 static_cast<unsigned long>(st.rejected));
                        break;
                    case DeliveryOutcome::UNREACHABLE:
                        if (Logger::throttle(last_unreachable_log, unreachable_log_primed, now,
                                             Config::Tasks::Telemetry::unreachable_log_interval_ms)) {
                            LOG_WARN(TAG, "Broker unreachable (%s), %lu consecutive",
                                     MqttClient::toString(s_transport->lastResult()),
                                     static_cast<unsigned long>(st.consecutive_unreachable));
                        }
                        break;
                }
            }

            if (Logger::throttle(last_stats_log, stats_log_primed, now, kStatsLogPeriodMs)) {
                const PublisherStats& st = publisher.stats();
                LOG_INFO(TAG, "attempts=%lu delivered=%lu rejected=%lu unreachable=%lu",
                         static_cast<unsigned long>(st.attempts), static_cast<unsigned long>(st.delivered),
                         static_cast<unsigned long>(st.rejected), static_cast<unsigned long>(st.unreachable));
            }

            vTaskDelay(pdMS_TO_TICKS(Config::Tasks::Telemetry::loop_period_ms));
        }
    }
}

namespace TelemetryTask {
    void create(QueueHandle_t latest_sample_queue, WiFiManager& wifi, MqttClient& mqtt) {
        q_latest = latest_sample_queue;
        static MqttTelemetryTransport transport(wifi, mqtt);
        s_transport = &transport;
        xTaskCreateStatic(taskFunction, "telemetry",
                          sizeof(s_task_stack) / sizeof(StackType_t), nullptr,
                          Config::TaskPriorities::NORMAL, s_task_stack, &s_task_tcb);
    }
}
