#ifndef SAFETY_MONITOR_TASK_HPP
#define SAFETY_MONITOR_TASK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

namespace SafetyMonitorTask {
    // Periodic sampling loop: sensors -> SOS latch -> state resolver.
    // alarm_queue receives AlarmEvent on state changes (may be null);
    // latest_sample_queue (length 1) is overwritten with every ResolvedSample.
    void create(QueueHandle_t alarm_queue, QueueHandle_t latest_sample_queue);
}

#endif // SAFETY_MONITOR_TASK_HPP
