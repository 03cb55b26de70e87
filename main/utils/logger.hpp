#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <cstdarg>
#include <esp_log.h>

// Fixed-size formatting buffer to avoid heap usage
#ifndef LOGGER_MAX_MESSAGE_LEN
#define LOGGER_MAX_MESSAGE_LEN 160
#endif

enum class LogLevel {
    ERROR = 0,
    WARN  = 1,
    INFO  = 2,
    DEBUG = 3
};

// Thin gate in front of esp_log. Never call from inside a critical section:
// esp_log may block on its own lock.
class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Lets callers skip building multi-line reports nobody will see
    static bool isEnabled(LogLevel level);

    static void write(LogLevel level, const char* tag, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

    // Quiet chatty IDF components (e.g. "gpio") independently of our gate
    static void setEspLogLevel(const char* tag, esp_log_level_t level);

private:
    static esp_log_level_t toEspLevel(LogLevel level);
    static LogLevel s_level;
};

#define LOG_ERROR(TAG, FMT, ...) Logger::write(LogLevel::ERROR, (TAG), (FMT), ##__VA_ARGS__)
#define LOG_WARN(TAG, FMT, ...)  Logger::write(LogLevel::WARN,  (TAG), (FMT), ##__VA_ARGS__)
#define LOG_INFO(TAG, FMT, ...)  Logger::write(LogLevel::INFO,  (TAG), (FMT), ##__VA_ARGS__)
#define LOG_DEBUG(TAG, FMT, ...) Logger::write(LogLevel::DEBUG, (TAG), (FMT), ##__VA_ARGS__)

#endif // LOGGER_HPP
