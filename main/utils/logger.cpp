#include <main/utils/logger.hpp>
#include <cstdio>

LogLevel Logger::s_level = LogLevel::INFO;

void Logger::setLevel(LogLevel level) {
    s_level = level;
}

LogLevel Logger::getLevel() {
    return s_level;
}

bool Logger::isEnabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(s_level);
}

void Logger::setEspLogLevel(const char* tag, esp_log_level_t level) {
    esp_log_level_set(tag, level);
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

void Logger::write(LogLevel level, const char* tag, const char* fmt, ...) {
    if (!isEnabled(level)) {
        return;
    }

    char buffer[LOGGER_MAX_MESSAGE_LEN];
    va_list args;
    va_start(args, fmt);
    int n = vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    const char* message = buffer;
    if (n < 0) {
        message = "formatting error";
    } else {
        // Truncated output is still terminated
        buffer[sizeof(buffer) - 1] = '\0';
    }

    switch (toEspLevel(level)) {
        case ESP_LOG_ERROR: ESP_LOGE(tag, "%s", message); break;
        case ESP_LOG_WARN:  ESP_LOGW(tag, "%s", message); break;
        case ESP_LOG_DEBUG: ESP_LOGD(tag, "%s", message); break;
        default:            ESP_LOGI(tag, "%s", message); break;
    }
}
