#ifndef ALARM_CONTROL_TASK_HPP
#define ALARM_CONTROL_TASK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <driver/gpio.h>

namespace AlarmControlTask {
    // Listens for AlarmEvent messages on alarm_queue and drives the buzzer.
    // follow_device_state: also track DeviceStateMachine so a lost event
    // cannot leave a pattern running (wearable role only).
    void create(QueueHandle_t alarm_queue, gpio_num_t buzzer_pin, bool follow_device_state);
}

#endif // ALARM_CONTROL_TASK_HPP
