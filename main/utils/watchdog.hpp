#ifndef WATCHDOG_HPP
#define WATCHDOG_HPP

#include <esp_task_wdt.h>

namespace Watchdog {
    // Configure the task watchdog (call once from app_main before tasks start)
    void init();
    // Subscribe the calling task; name is only used for logging
    void subscribe(const char* task_name);
    // Reset the calling task's timer; call once per loop iteration
    void feed();
}

#endif // WATCHDOG_HPP
