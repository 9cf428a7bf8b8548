#include <main/tasks/console_task.hpp>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <freertos/semphr.h>
#include <main/config/config.hpp>
#include <main/console/console_monitor.hpp>
#include <main/models/alarm_event.hpp>
#include <main/models/telemetry_report.hpp>
#include <main/network/ingress_server.hpp>
#include <main/network/mqtt_client.hpp>
#include <main/network/wifi_manager.hpp>
#include <main/telemetry/envelope_codec.hpp>
#include <main/utils/logger.hpp>
#include <main/utils/time_sync.hpp>
#include <main/utils/watchdog.hpp>

namespace {
    static const char* TAG = "CONSOLE";

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[8192 / sizeof(StackType_t)];

    static QueueHandle_t q_reports = nullptr;
    static QueueHandle_t q_alarm = nullptr;
    static WiFiManager* s_wifi = nullptr;

    // Large (fixed arrays per device); kept out of the task stack
    static ConsoleMonitor s_monitor;
    // Shared with the httpd task, which reserves device slots
    static StaticSemaphore_t s_monitor_lock_buffer;
    static SemaphoreHandle_t s_monitor_lock = nullptr;

    static constexpr uint32_t kAdmitWaitMs = 100;

    static inline uint32_t nowMs() {
        return static_cast<uint32_t>(xTaskGetTickCount() * portTICK_PERIOD_MS);
    }

    // Runs in the esp-mqtt task: decode and hand over, nothing else
    static void onTelemetryMessage(void* ctx, const char* topic, int topic_len,
                                   const char* payload, int length) {
        QueueHandle_t queue = static_cast<QueueHandle_t>(ctx);
        TelemetryReport report{};
        EnvelopeCodec::DecodeError err = EnvelopeCodec::decodeEnvelope(payload, length, report);
        if (err != EnvelopeCodec::DecodeError::NONE) {
            LOG_WARN(TAG, "Dropped envelope on %.*s: %s", topic_len, topic, EnvelopeCodec::toString(err));
            return;
        }
        if (queue == nullptr || xQueueSend(queue, &report, 0) != pdTRUE) {
            LOG_WARN(TAG, "Report queue full, dropped envelope from %s", report.device_id);
        }
    }

    // Runs in the httpd task before the report is queued
    static bool admitDevice(void* ctx, const char* device_id) {
        (void)ctx;
        if (xSemaphoreTake(s_monitor_lock, pdMS_TO_TICKS(kAdmitWaitMs)) != pdTRUE) {
            LOG_WARN(TAG, "Console busy, refusing report from %s", device_id);
            return false;
        }
        uint32_t evicted_before = s_monitor.evictedCount();
        ConsoleMonitor::AcceptResult result = s_monitor.reserve(device_id, nowMs());
        bool evicted = s_monitor.evictedCount() != evicted_before;
        xSemaphoreGive(s_monitor_lock);

        if (result == ConsoleMonitor::AcceptResult::DEVICE_TABLE_FULL) {
            LOG_ERROR(TAG, "Device table full (%u live), refusing %s",
                      static_cast<unsigned>(Config::Console::max_devices), device_id);
        } else if (evicted) {
            LOG_WARN(TAG, "Reused an offline device slot for %s", device_id);
        }
        return result == ConsoleMonitor::AcceptResult::ACCEPTED;
    }

    static void logNewAlerts(uint32_t& logged) {
        const AlertLog& log = s_monitor.alerts();
        uint32_t fresh = log.appendedCount() - logged;
        if (fresh > log.size()) {
            fresh = static_cast<uint32_t>(log.size());
        }
        for (uint32_t i = fresh; i > 0; --i) {
            const AlertLogEntry& e = log.newestFirst(i - 1);
            LOG_WARN(TAG, "ALERT %s %s %s: %s", e.clock[0] ? e.clock : "--:--:--",
                     e.device_id, DeviceStatus::toString(e.state), e.cause);
        }
        logged = log.appendedCount();
    }

    static void announce(uint32_t now) {
        for (std::size_t i = 0; i < s_monitor.deviceCount(); ++i) {
            DeviceState state;
            if (!s_monitor.shouldAnnounce(i, now, state)) {
                continue;
            }
            ConsoleMonitor::DeviceView view{};
            (void)s_monitor.device(i, view);
            LOG_WARN(TAG, "Attention: %s is %s", view.device_id, DeviceStatus::toString(state));
            if (q_alarm) {
                AlarmEvent evt{};
                evt.timestamp_ms = now;
                evt.type = (state == DeviceState::SOS)       ? AlarmType::SOS
                         : (state == DeviceState::EMERGENCY) ? AlarmType::EMERGENCY
                                                             : AlarmType::WARNING;
                evt.one_shot = true;
                (void)xQueueSend(q_alarm, &evt, 0);
            }
        }
    }

    static void logSummary(uint32_t now) {
        LOG_INFO(TAG, "%u device(s), %u alert(s) logged",
                 static_cast<unsigned>(s_monitor.deviceCount()),
                 static_cast<unsigned>(s_monitor.alerts().size()));
        for (std::size_t i = 0; i < s_monitor.deviceCount(); ++i) {
            ConsoleMonitor::DeviceView view{};
            if (!s_monitor.device(i, view)) {
                continue;
            }
            TemperatureStats t = view.analytics->temperatureStats();
            StateBreakdown b = view.analytics->stateBreakdown();
            GeoPoint last{};
            bool has_pos = view.trail->newest(last);
            LOG_INFO(TAG, "  %s %s | T min/avg/max %.1f/%.1f/%.1f (n=%u) | moving %d%% | "
                          "N/W/E/S %.0f/%.0f/%.0f/%.0f%% | trail %u%s",
                     view.device_id, DeviceStatus::toString(view.liveness->displayedState(now)),
                     static_cast<double>(t.min_c), static_cast<double>(t.avg_c), static_cast<double>(t.max_c),
                     static_cast<unsigned>(t.count), view.analytics->movingPercent(),
                     static_cast<double>(b.percent[0]), static_cast<double>(b.percent[1]),
                     static_cast<double>(b.percent[2]), static_cast<double>(b.percent[3]),
                     static_cast<unsigned>(view.trail->size()), has_pos ? "" : " (no fix)");
            if (has_pos) {
                LOG_DEBUG(TAG, "  %s last position %.6f, %.6f", view.device_id, last.latitude, last.longitude);
            }
        }
    }

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Console Task started");
        Watchdog::subscribe("console");

        static QueueIngressSink sink(q_reports, &admitDevice, nullptr);
        static IngressServer server(&sink);

        bool time_inited = false;
        uint32_t alerts_logged = 0;
        uint32_t evictions_logged = 0;
        uint32_t last_tick = 0;
        uint32_t last_summary = 0;
        bool summary_primed = false;
        char clock[16] = "";

        for (;;) {
            Watchdog::feed();

            if (s_wifi->hasIp()) {
                if (!time_inited) {
                    TimeSync::init();
                    time_inited = true;
                }
                if (!server.isRunning()) {
                    (void)server.start();
                }
            }

            TelemetryReport report{};
            bool received = xQueueReceive(q_reports, &report,
                                          pdMS_TO_TICKS(Config::Tasks::Console::tick_period_ms)) == pdTRUE;

            xSemaphoreTake(s_monitor_lock, portMAX_DELAY);
            if (received) {
                do {
                    uint32_t now = nowMs();
                    TimeSync::formatClock(clock, sizeof(clock));
                    switch (s_monitor.accept(report, now, clock)) {
                        case ConsoleMonitor::AcceptResult::ACCEPTED:
                            LOG_DEBUG(TAG, "Report from %s", report.device_id);
                            break;
                        case ConsoleMonitor::AcceptResult::DUPLICATE:
                            LOG_DEBUG(TAG, "Duplicate envelope from %s", report.device_id);
                            break;
                        case ConsoleMonitor::AcceptResult::DEVICE_TABLE_FULL:
                            // Only MQTT arrivals get here; HTTP ones were admitted up front
                            LOG_ERROR(TAG, "Device table full (%u live), ignoring %s",
                                      static_cast<unsigned>(Config::Console::max_devices), report.device_id);
                            break;
                        case ConsoleMonitor::AcceptResult::INVALID:
                            LOG_WARN(TAG, "%s", "Report without device id");
                            break;
                    }
                } while (xQueueReceive(q_reports, &report, 0) == pdTRUE);
            }

            uint32_t now = nowMs();
            if ((now - last_tick) >= Config::Tasks::Console::tick_period_ms) {
                last_tick = now;
                TimeSync::formatClock(clock, sizeof(clock));
                s_monitor.tick(now, clock);
                announce(now);
            }
            logNewAlerts(alerts_logged);

            if (Logger::throttle(last_summary, summary_primed, now, Config::Tasks::Console::summary_period_ms)) {
                logSummary(now);
            }
            if (s_monitor.evictedCount() != evictions_logged) {
                LOG_WARN(TAG, "%u offline device slot(s) reused so far",
                         static_cast<unsigned>(s_monitor.evictedCount()));
                evictions_logged = s_monitor.evictedCount();
            }
            xSemaphoreGive(s_monitor_lock);
        }
    }
}

namespace ConsoleTask {
    void create(QueueHandle_t report_queue, QueueHandle_t alarm_queue,
                WiFiManager& wifi, MqttClient& mqtt) {
        q_reports = report_queue;
        q_alarm = alarm_queue;
        s_wifi = &wifi;
        s_monitor_lock = xSemaphoreCreateMutexStatic(&s_monitor_lock_buffer);

        // Registered before the MQTT client starts; replayed on every connect
        mqtt.setMessageHandler(&onTelemetryMessage, report_queue);
        if (!mqtt.subscribe(Config::Mqtt::Topics::TELEMETRY_ALL, Config::Mqtt::telemetry_qos)) {
            LOG_ERROR(TAG, "%s", "Telemetry subscription not registered");
        }

        xTaskCreateStatic(taskFunction, "console",
                          sizeof(s_task_stack) / sizeof(StackType_t), nullptr,
                          Config::TaskPriorities::NORMAL, s_task_stack, &s_task_tcb);
    }
}
