#include "admit/logger.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace admit {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_log_mu;

const char* LevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[90m[DEBUG]";
        case LogLevel::Info:  return "[INFO] ";
        case LogLevel::Warn:  return "\033[33m[WARN] ";
        case LogLevel::Error: return "\033[31m[ERROR]";
    }
    return "[INFO] ";
}

void Emit(LogLevel level, const char* fmt, va_list ap) {
    if (level < g_level.load(std::memory_order_relaxed)) return;

    char stamp[32];
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    ::gmtime_r(&now, &tm);
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm);

    char line[2048];
    std::vsnprintf(line, sizeof(line), fmt, ap);

    const bool colored = (level != LogLevel::Info);
    std::lock_guard<std::mutex> lk(g_log_mu);
    std::fprintf(stderr, "%s %s %s%s\n", stamp, LevelTag(level), line, colored ? "\033[0m" : "");
}

} // namespace

void SetLogLevel(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel GetLogLevel() {
    return g_level.load(std::memory_order_relaxed);
}

void LogDebug(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    Emit(LogLevel::Debug, fmt, ap);
    va_end(ap);
}

void LogInfo(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    Emit(LogLevel::Info, fmt, ap);
    va_end(ap);
}

void LogWarn(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    Emit(LogLevel::Warn, fmt, ap);
    va_end(ap);
}

void LogError(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    Emit(LogLevel::Error, fmt, ap);
    va_end(ap);
}

} // namespace admit
