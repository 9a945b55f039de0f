#include <memguard/core/logger.hpp>
#include <memguard/core/utils.hpp>

namespace memguard {

bool parse_log_level(const std::string& s, LogLevel& out) {
    std::string v = to_lower(trim(s));
    if (v == "debug") { out = LogLevel::DEBUG; return true; }
    if (v == "info")  { out = LogLevel::INFO;  return true; }
    if (v == "warn" || v == "warning") { out = LogLevel::WARN; return true; }
    if (v == "error") { out = LogLevel::ERROR; return true; }
    return false;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

void Logger::debug(const char* fmt, ...) {
    if (level_ > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl("DEBUG", fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    if (level_ > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl("INFO", fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    if (level_ > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl("WARN", fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    if (level_ > LogLevel::ERROR) return;
    va_list args;
    va_start(args, fmt);
    log_impl("ERROR", fmt, args);
    va_end(args);
}

Logger::Logger() : level_(LogLevel::INFO) {}

void Logger::log_impl(const char* level_str, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);
    
    // One lock per line so concurrent requests don't interleave output
    std::lock_guard<std::mutex> lock(mutex_);
    fprintf(stderr, "[%s] [%s] ", timestamp, level_str);
    vfprintf(stderr, fmt, args);
    fprintf(stderr, "\n");
    fflush(stderr);
}

} // namespace memguard
