#ifndef MEMGUARD_CORE_LOGGER_HPP
#define MEMGUARD_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>
#include <atomic>

namespace memguard {

#ifdef __GNUC__
#  define MEMGUARD_API __attribute__((visibility("default")))
#else
#  define MEMGUARD_API
#endif

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
// Returns false and leaves 'out' untouched for anything else.
bool parse_log_level(const std::string& s, LogLevel& out);

class MEMGUARD_API Logger {
public:
    static Logger& instance();
    
    void set_level(LogLevel level);
    LogLevel level() const;
    
    // Lines go to stderr
    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);
    
    void log_impl(const char* level_str, const char* fmt, va_list args);
    
    std::atomic<LogLevel> level_;
    std::mutex mutex_;
};

#define LOG_DEBUG(...) memguard::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  memguard::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  memguard::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) memguard::Logger::instance().error(__VA_ARGS__)

} // namespace memguard

#endif // MEMGUARD_CORE_LOGGER_HPP
