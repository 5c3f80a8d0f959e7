#pragma once

namespace admit {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
};

void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

void LogDebug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void LogInfo(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void LogWarn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void LogError(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace admit
