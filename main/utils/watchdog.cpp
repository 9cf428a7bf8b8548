#include <main/utils/watchdog.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>

namespace {
    static const char* TAG = "WATCHDOG";
}

namespace Watchdog {
    void init() {
        esp_task_wdt_config_t config = {
            .timeout_ms = Config::Tasks::Watchdog::timeout_ms,
            .idle_core_mask = 0,  // idle tasks are not monitored
            .trigger_panic = true
        };
        esp_err_t err = esp_task_wdt_reconfigure(&config);
        if (err == ESP_ERR_INVALID_STATE) {
            // TWDT not started by sdkconfig; bring it up ourselves
            err = esp_task_wdt_init(&config);
        }
        if (err == ESP_OK) {
            LOG_INFO(TAG, "TWDT armed: %lu ms timeout",
                     static_cast<unsigned long>(Config::Tasks::Watchdog::timeout_ms));
        } else {
            LOG_ERROR(TAG, "TWDT setup failed: %d", static_cast<int>(err));
        }
    }

    void subscribe(const char* task_name) {
        esp_err_t err = esp_task_wdt_add(nullptr);
        if (err != ESP_OK) {
            LOG_WARN(TAG, "TWDT subscribe failed for %s: %d", task_name, static_cast<int>(err));
        } else {
            LOG_DEBUG(TAG, "TWDT watching %s", task_name);
        }
    }

    void feed() {
        (void)esp_task_wdt_reset();
    }
}
