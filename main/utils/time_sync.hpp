// SNTP wall-clock helper for the console. Device-side telemetry never
// depends on it; envelopes carry device-local milliseconds.
#ifndef TIME_SYNC_HPP
#define TIME_SYNC_HPP

#include <cstddef>

namespace TimeSync {
    // Start SNTP once (idempotent)
    void init();

    // True once system time looks like a real date
    bool isSynced();

    // "HH:MM:SS" (UTC) into out, or an empty string while unsynced.
    // Returns out for convenience.
    const char* formatClock(char* out, std::size_t out_size);
}

#endif // TIME_SYNC_HPP
