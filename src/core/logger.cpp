#include <rankpoll/core/logger.hpp>
#include <rankpoll/core/utils.hpp>

namespace rankpoll {

LogLevel parse_log_level(const std::string& name, LogLevel def) {
    std::string n = to_lower(trim(name));
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "info") return LogLevel::INFO;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    return def;
}

const char* log_level_str(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) { level_.store(level); }

LogLevel Logger::level() const { return level_.load(); }

void Logger::set_sink(FILE* sink) { sink_.store(sink ? sink : stderr); }

void Logger::debug(const char* fmt, ...) {
    if (level_.load() > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::DEBUG, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    if (level_.load() > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::INFO, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    if (level_.load() > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::WARN, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::ERROR, fmt, args);
    va_end(args);
}

Logger::Logger() : level_(LogLevel::INFO), sink_(stderr) {}

void Logger::log_impl(LogLevel level, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);
    
    // Delivery workers log concurrently; hold the stream for the whole line
    FILE* out = sink_.load();
    flockfile(out);
    fprintf(out, "[%s] [%s] ", timestamp, log_level_str(level));
    vfprintf(out, fmt, args);
    fprintf(out, "\n");
    fflush(out);
    funlockfile(out);
}

} // namespace rankpoll
