#include <main/utils/time_sync.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>

#include <ctime>
#include <sys/time.h>
#include <esp_sntp.h>

namespace {
    static const char* TAG = "TIME_SYNC";
    static bool s_inited = false;

    // Anything before 2025-01-01 00:00:00 UTC means the RTC was never set
    static constexpr time_t kEarliestPlausibleEpoch = 1735689600;

    static bool timeIsPlausible() {
        time_t now = 0;
        time(&now);
        return now >= kEarliestPlausibleEpoch;
    }
}

namespace TimeSync {
    void init() {
        if (s_inited) {
            return;
        }
        esp_sntp_setoperatingmode(ESP_SNTP_OPMODE_POLL);
        esp_sntp_setservername(0, Config::TimeSync::primary_server);
        esp_sntp_setservername(1, Config::TimeSync::secondary_server);
        esp_sntp_set_time_sync_notification_cb([](struct timeval*) {
            LOG_INFO(TAG, "%s", "SNTP time synchronized");
        });
        esp_sntp_init();
        s_inited = true;
        LOG_INFO(TAG, "SNTP started (%s, %s)", Config::TimeSync::primary_server,
                 Config::TimeSync::secondary_server);
    }

    bool isSynced() {
        if (!s_inited) {
            return false;
        }
        return timeIsPlausible() || sntp_get_sync_status() == SNTP_SYNC_STATUS_COMPLETED;
    }

    const char* formatClock(char* out, std::size_t out_size) {
        if (out_size == 0) {
            return out;
        }
        out[0] = '\0';
        if (!isSynced()) {
            return out;
        }
        time_t now = 0;
        time(&now);
        struct tm tm_utc;
        gmtime_r(&now, &tm_utc);
        (void)strftime(out, out_size, "%H:%M:%S", &tm_utc);
        return out;
    }
}
