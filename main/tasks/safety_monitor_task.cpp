#include <main/tasks/safety_monitor_task.hpp>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <main/config/config.hpp>
#include <main/hardware/gps_receiver.hpp>
#include <main/hardware/motion_sensor.hpp>
#include <main/hardware/sos_button.hpp>
#include <main/hardware/temperature_sensor.hpp>
#include <main/models/alarm_event.hpp>
#include <main/models/resolved_sample.hpp>
#include <main/state/device_state.hpp>
#include <main/state/sos_latch.hpp>
#include <main/state/state_resolver.hpp>
#include <main/utils/logger.hpp>
#include <main/utils/watchdog.hpp>

namespace {
    static const char* TAG = "SAFETY_MON";

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[4096 / sizeof(StackType_t)];

    static QueueHandle_t q_alarm = nullptr;
    static QueueHandle_t q_latest = nullptr;

    static SosButton s_button;
    static MotionSensor s_motion;
    static TemperatureSensor s_temperature;
    static GpsReceiver s_gps;

    // Retry a missing sensor at most this often
    static constexpr uint32_t kSensorRetryMs = 2000;

    struct TemperatureCache {
        float    value_c = 0.0f;
        uint32_t read_ms = 0;
        uint32_t last_attempt_ms = 0;
        bool     valid = false;
        bool     attempted = false;
    };

    static inline uint32_t nowMs() {
        return static_cast<uint32_t>(xTaskGetTickCount() * portTICK_PERIOD_MS);
    }

    static void sendAlarm(AlarmType type, uint32_t now_ms) {
        if (!q_alarm) return;
        AlarmEvent evt{};
        evt.timestamp_ms = now_ms;
        evt.type = type;
        if (xQueueSend(q_alarm, &evt, 0) != pdTRUE) {
            LOG_WARN(TAG, "%s", "Alarm queue full, event dropped");
        }
    }

    static AlarmType alarmFor(DeviceState state) {
        switch (state) {
            case DeviceState::SOS:       return AlarmType::SOS;
            case DeviceState::EMERGENCY: return AlarmType::EMERGENCY;
            case DeviceState::WARNING:   return AlarmType::WARNING;
            default:                     return AlarmType::CLEAR;
        }
    }

    static void readMotion(SensorSnapshot& snap, uint32_t now_ms, uint32_t& last_retry_ms) {
        if (!s_motion.isReady()) {
            if ((now_ms - last_retry_ms) >= kSensorRetryMs) {
                last_retry_ms = now_ms;
                (void)s_motion.init();
            }
            return;
        }
        float total_g = 0.0f;
        if (s_motion.readMagnitude(total_g)) {
            snap.total_acc_g = total_g;
            snap.acc_deviation_g = total_g - 1.0f;
            snap.motion_valid = true;
        }
    }

    static void readTemperature(SensorSnapshot& snap, uint32_t now_ms, TemperatureCache& cache) {
        using namespace Config::Tasks::Sampling;
        if (!cache.attempted || (now_ms - cache.last_attempt_ms) >= temperature_period_ms) {
            cache.attempted = true;
            cache.last_attempt_ms = now_ms;
            float c = 0.0f;
            if (s_temperature.isReady() && s_temperature.readTemperature(c)) {
                cache.value_c = c;
                cache.read_ms = now_ms;
                cache.valid = true;
            } else if (!s_temperature.isReady()) {
                (void)s_temperature.init();
            }
        }
        // A stale reading is reported as invalid rather than reused
        if (cache.valid && (now_ms - cache.read_ms) <= temperature_max_age_ms) {
            snap.temperature_c = cache.value_c;
            snap.temperature_valid = true;
        }
    }

    static void logTransition(DeviceState from, const Resolution& res) {
        char suffix[32];
        DeviceStatus::formatCauseSuffix(res.state, res.causes, suffix, sizeof(suffix));
        if (suffix[0] != '\0') {
            LOG_WARN(TAG, "State %s -> %s (%s)", DeviceStatus::toString(from),
                     DeviceStatus::toString(res.state), suffix);
        } else {
            LOG_INFO(TAG, "State %s -> %s", DeviceStatus::toString(from), DeviceStatus::toString(res.state));
        }
    }

    static void taskFn(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Safety Monitor Task started");
        Watchdog::subscribe("safety_monitor");

        ReleaseEdgeDetector edges;
        SosLatch latch;
        MotionTimer timer;
        TemperatureCache temp_cache;
        uint32_t motion_retry_ms = nowMs();
        bool motion_was_ok = true;
        bool temp_was_ok = true;

        TickType_t last_wake = xTaskGetTickCount();
        const TickType_t period = pdMS_TO_TICKS(Config::Tasks::Sampling::period_ms);

        for (;;) {
            Watchdog::feed();
            uint32_t now = nowMs();

            SensorSnapshot snap{};
            snap.ts_ms = now;
            snap.sos_released = edges.update(s_button.isPressed());
            if (snap.sos_released) {
                bool was_active = latch.isActive();
                if (latch.onReleaseEdge(now)) {
                    if (latch.isActive() && !was_active) {
                        LOG_WARN(TAG, "%s", "SOS activated");
                    } else if (!latch.isActive() && was_active) {
                        LOG_INFO(TAG, "%s", "SOS cleared");
                    } else if (latch.isActive()) {
                        LOG_INFO(TAG, "SOS clear press, %u more needed",
                                 static_cast<unsigned>(latch.pendingDeactivationPresses()));
                    }
                }
            }

            readMotion(snap, now, motion_retry_ms);
            readTemperature(snap, now, temp_cache);

            s_gps.poll(now);
            GpsFix fix;
            if (s_gps.latestFix(now, fix)) {
                snap.latitude = fix.latitude;
                snap.longitude = fix.longitude;
                snap.has_fix = true;
            }

            ResolvedSample sample{};
            sample.snapshot = snap;
            sample.resolution = StateResolver::resolve(snap, timer, latch);
            const Resolution& res = sample.resolution;

            if (res.health.motion_ok != motion_was_ok) {
                LOG_WARN(TAG, "Motion sensor %s", res.health.motion_ok ? "recovered" : "failed");
                motion_was_ok = res.health.motion_ok;
            }
            if (res.health.environment_ok != temp_was_ok) {
                LOG_WARN(TAG, "Temperature sensor %s", res.health.environment_ok ? "recovered" : "failed");
                temp_was_ok = res.health.environment_ok;
            }

            DeviceState previous = DeviceStateMachine::get();
            if (DeviceStateMachine::set(res.state, res.causes, res.health, now)) {
                logTransition(previous, res);
                sendAlarm(alarmFor(res.state), now);
            }

            if (q_latest) {
                (void)xQueueOverwrite(q_latest, &sample);
            }

            vTaskDelayUntil(&last_wake, period);
        }
    }
}

namespace SafetyMonitorTask {
    void create(QueueHandle_t alarm_queue, QueueHandle_t latest_sample_queue) {
        q_alarm = alarm_queue;
        q_latest = latest_sample_queue;

        DeviceStateMachine::init();

        // Missing sensors are not fatal: they surface as health flags
        if (!s_button.init()) {
            LOG_ERROR(TAG, "%s", "SOS button unavailable");
        }
        if (!s_motion.init()) {
            LOG_WARN(TAG, "%s", "Motion sensor not ready, will retry");
        }
        if (!s_temperature.init()) {
            LOG_WARN(TAG, "%s", "Temperature sensor not ready, will retry");
        }
        if (!s_gps.init()) {
            LOG_WARN(TAG, "%s", "GPS unavailable, position will report NO_SIGNAL");
        }

        xTaskCreateStatic(taskFn, "safety_monitor",
                          sizeof(s_task_stack) / sizeof(StackType_t), nullptr,
                          Config::TaskPriorities::HIGH, s_task_stack, &s_task_tcb);
    }
}
