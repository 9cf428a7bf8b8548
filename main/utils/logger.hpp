#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <cstdarg>
#include <cstdint>
#include <esp_log.h>

// Fixed-size formatting buffer to avoid heap usage
#ifndef LOGGER_MAX_MESSAGE_LEN
#define LOGGER_MAX_MESSAGE_LEN 256
#endif

enum class LogLevel {
    ERROR = 0,
    WARN  = 1,
    INFO  = 2,
    DEBUG = 3
};

class Logger {
public:
    // Set the gate level and align ESP-IDF's own output for all tags
    static void init(LogLevel level);
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    static void error(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    static void warn(const char* tag, const char* fmt, ...)  __attribute__((format(printf, 2, 3)));
    static void info(const char* tag, const char* fmt, ...)  __attribute__((format(printf, 2, 3)));
    static void debug(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

    // Rate limiter for repetitive conditions (e.g. broker unreachable).
    // Returns true and updates last_ms when at least interval_ms has passed.
    static bool throttle(uint32_t& last_ms, bool& primed, uint32_t now_ms, uint32_t interval_ms);

private:
    static void emit(LogLevel level, const char* tag, const char* fmt, va_list args);
    static esp_log_level_t toEspLevel(LogLevel level);
    static LogLevel s_level;
};

// Convenience macros (no heap, fixed buffer)
#define LOG_ERROR(TAG, FMT, ...) Logger::error((TAG), (FMT), ##__VA_ARGS__)
#define LOG_WARN(TAG, FMT, ...)  Logger::warn((TAG),  (FMT), ##__VA_ARGS__)
#define LOG_INFO(TAG, FMT, ...)  Logger::info((TAG),  (FMT), ##__VA_ARGS__)
#define LOG_DEBUG(TAG, FMT, ...) Logger::debug((TAG), (FMT), ##__VA_ARGS__)

#endif // LOGGER_HPP
