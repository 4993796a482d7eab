#ifndef RANKPOLL_CORE_LOGGER_HPP
#define RANKPOLL_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <atomic>

namespace rankpoll {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Unknown names yield def.
LogLevel parse_log_level(const std::string& name, LogLevel def = LogLevel::INFO);

const char* log_level_str(LogLevel level);

class Logger {
public:
    static Logger& instance();
    
    void set_level(LogLevel level);
    LogLevel level() const;
    
    // Redirect output (defaults to stderr). Passing NULL restores stderr.
    void set_sink(FILE* sink);
    
    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);
    
    void log_impl(LogLevel level, const char* fmt, va_list args);
    
    // Read by every logging thread; may change while they run
    std::atomic<LogLevel> level_;
    std::atomic<FILE*> sink_;
};

// Convenience macros
#define LOG_DEBUG(...) rankpoll::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  rankpoll::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  rankpoll::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) rankpoll::Logger::instance().error(__VA_ARGS__)

} // namespace rankpoll

#endif // RANKPOLL_CORE_LOGGER_HPP
