#include <main/utils/logger.hpp>
#include <cstdio>

LogLevel Logger::s_level = LogLevel::INFO;

void Logger::init(LogLevel level) {
    s_level = level;
    esp_log_level_set("*", toEspLevel(level));
}

void Logger::setLevel(LogLevel level) {
    s_level = level;
}

LogLevel Logger::getLevel() {
    return s_level;
}

esp_log_level_t Logger::toEspLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return ESP_LOG_ERROR;
        case LogLevel::WARN:  return ESP_LOG_WARN;
        case LogLevel::INFO:  return ESP_LOG_INFO;
        case LogLevel::DEBUG: return ESP_LOG_DEBUG;
    }
    return ESP_LOG_INFO;
}

bool Logger::throttle(uint32_t& last_ms, bool& primed, uint32_t now_ms, uint32_t interval_ms) {
    if (primed && (now_ms - last_ms) < interval_ms) {
        return false;
    }
    primed = true;
    last_ms = now_ms;
    return true;
}

void Logger::emit(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (static_cast<int>(s_level) < static_cast<int>(level)) {
        return;
    }
    char buffer[LOGGER_MAX_MESSAGE_LEN];
    const char* text = buffer;
    int n = vsnprintf(buffer, sizeof(buffer), fmt, args);
    if (n < 0) {
        text = "formatting error";
    } else {
        // Truncated output is still terminated within the buffer
        buffer[sizeof(buffer) - 1] = '\0';
    }

    switch (level) {
        case LogLevel::ERROR: ESP_LOGE(tag, "%s", text); break;
        case LogLevel::WARN:  ESP_LOGW(tag, "%s", text); break;
        case LogLevel::INFO:  ESP_LOGI(tag, "%s", text); break;
        case LogLevel::DEBUG: ESP_LOGD(tag, "%s", text); break;
    }
}

void Logger::error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::ERROR, tag, fmt, args);
    va_end(args);
}

void Logger::warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::WARN, tag, fmt, args);
    va_end(args);
}

void Logger::info(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::INFO, tag, fmt, args);
    va_end(args);
}

void Logger::debug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::DEBUG, tag, fmt, args);
    va_end(args);
}
