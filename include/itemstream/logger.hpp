#pragma once

namespace itemstream {

enum class LogLevel {
    Debug,
    Info,
    Error,
    Success
};

// Debug lines are dropped unless verbose output is enabled.
void SetVerbose(bool enabled);
bool VerboseEnabled();

void LogDebug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void LogInfo(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void LogError(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void LogSuccess(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace itemstream
