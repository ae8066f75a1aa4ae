#include "itemstream/logger.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <unistd.h>

namespace itemstream {

namespace {

std::atomic<bool> g_verbose{false};

// Everything goes to stderr; stdout belongs to the items.
void Emit(LogLevel level, const char* fmt, va_list args) {
    static const bool color = ::isatty(STDERR_FILENO) != 0;

    const char* prefix = "";
    const char* start = "";
    switch (level) {
        case LogLevel::Debug:
            prefix = "[DEBUG] ";
            start = "\033[90m";
            break;
        case LogLevel::Info:
            prefix = "[INFO]  ";
            break;
        case LogLevel::Error:
            prefix = "[ERROR] ";
            start = "\033[31m";
            break;
        case LogLevel::Success:
            prefix = "[ OK  ] ";
            start = "\033[32m";
            break;
    }

    const bool colored = color && *start != '\0';
    std::fprintf(stderr, "%s%s", colored ? start : "", prefix);
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "%s\n", colored ? "\033[0m" : "");
}

} // namespace

void SetVerbose(bool enabled) {
    g_verbose.store(enabled, std::memory_order_relaxed);
}

bool VerboseEnabled() {
    return g_verbose.load(std::memory_order_relaxed);
}

void LogDebug(const char* fmt, ...) {
    if (!VerboseEnabled()) return;
    va_list args;
    va_start(args, fmt);
    Emit(LogLevel::Debug, fmt, args);
    va_end(args);
}

void LogInfo(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    Emit(LogLevel::Info, fmt, args);
    va_end(args);
}

void LogError(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    Emit(LogLevel::Error, fmt, args);
    va_end(args);
}

void LogSuccess(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    Emit(LogLevel::Success, fmt, args);
    va_end(args);
}

} // namespace itemstream
