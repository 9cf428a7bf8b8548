#include <main/tasks/alarm_control_task.hpp>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <main/utils/logger.hpp>
#include <main/hardware/buzzer.hpp>
#include <main/models/alarm_event.hpp>
#include <main/config/config.hpp>
#include <main/state/device_state.hpp>
#include <main/utils/watchdog.hpp>

namespace {
    static const char* TAG = "ALARM_TASK";

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[3072 / sizeof(StackType_t)];

    static QueueHandle_t s_alarm_queue = nullptr;
    static Buzzer* s_buzzer = nullptr;
    static bool s_follow_state = false;

    enum class Mode : uint8_t { NONE = 0, EMERGENCY = 1, SOS = 2 };
    static Mode s_mode = Mode::NONE;
    static TickType_t s_last_cycle = 0;

    // Gap between repeating pattern rounds
    static constexpr uint32_t kEmergencyCycleMs = 1500;
    static constexpr uint32_t kSosCycleMs = 1000;

    static void playOnce(AlarmType type) {
        if (!s_buzzer) return;
        switch (type) {
            case AlarmType::SOS:       s_buzzer->sosRound(); break;
            case AlarmType::EMERGENCY: s_buzzer->pulse(150, 100, 3); break;
            case AlarmType::WARNING:   s_buzzer->pulse(200, 0, 1); break;
            default: break;
        }
    }

    static void applyEvent(const AlarmEvent& evt) {
        if (evt.one_shot) {
            playOnce(evt.type);
            return;
        }
        switch (evt.type) {
            case AlarmType::SOS:
                s_mode = Mode::SOS;
                s_last_cycle = 0;
                break;
            case AlarmType::EMERGENCY:
                s_mode = Mode::EMERGENCY;
                s_last_cycle = 0;
                break;
            case AlarmType::WARNING:
                s_mode = Mode::NONE;
                playOnce(AlarmType::WARNING);
                break;
            case AlarmType::CLEAR:
            default:
                s_mode = Mode::NONE;
                if (s_buzzer) s_buzzer->off();
                break;
        }
    }

    static void syncWithDeviceState() {
        switch (DeviceStateMachine::get()) {
            case DeviceState::SOS:       s_mode = Mode::SOS; break;
            case DeviceState::EMERGENCY: s_mode = Mode::EMERGENCY; break;
            default:                     s_mode = Mode::NONE; break;
        }
    }

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Alarm Control Task started");
        if (s_buzzer) {
            // Boot chirp
            s_buzzer->pulse(60, 60, 2);
        }

        Watchdog::subscribe("alarm_control");

        for (;;) {
            Watchdog::feed();
            AlarmEvent evt{};
            // Short timeout so repeating patterns keep their cadence
            if (xQueueReceive(s_alarm_queue, &evt, pdMS_TO_TICKS(100)) == pdTRUE) {
                applyEvent(evt);
            }
            if (s_follow_state) {
                syncWithDeviceState();
            }
            if (s_mode == Mode::NONE || !s_buzzer) {
                continue;
            }

            TickType_t now = xTaskGetTickCount();
            TickType_t cycle = pdMS_TO_TICKS(s_mode == Mode::SOS ? kSosCycleMs : kEmergencyCycleMs);
            if (s_last_cycle == 0 || (now - s_last_cycle) >= cycle) {
                playOnce(s_mode == Mode::SOS ? AlarmType::SOS : AlarmType::EMERGENCY);
                s_last_cycle = xTaskGetTickCount();
            }
        }
    }
}

namespace AlarmControlTask {
    void create(QueueHandle_t alarm_queue, gpio_num_t buzzer_pin, bool follow_device_state) {
        s_alarm_queue = alarm_queue;
        s_follow_state = follow_device_state;

        static Buzzer buzzer(buzzer_pin, true);
        s_buzzer = &buzzer;
        if (!s_buzzer->init()) {
            LOG_WARN(TAG, "Buzzer init failed on GPIO %d", static_cast<int>(buzzer_pin));
            s_buzzer = nullptr;
        } else {
            LOG_INFO(TAG, "Buzzer ready on GPIO %d", static_cast<int>(buzzer_pin));
        }

        xTaskCreateStatic(taskFunction, "alarm_control",
                          sizeof(s_task_stack) / sizeof(StackType_t), nullptr,
                          Config::TaskPriorities::CRITICAL, s_task_stack, &s_task_tcb);
    }
}
