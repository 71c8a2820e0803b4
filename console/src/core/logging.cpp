#include "logging.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <string>

#ifdef _WIN32
#include <windows.h>
#endif

namespace Dspi::Console {

namespace {

std::atomic<LogLevel> s_logLevel{LogLevel::Warning};

} // namespace

void setLogLevel(LogLevel level) {
    s_logLevel.store(level, std::memory_order_relaxed);
}

LogLevel getLogLevel() {
    return s_logLevel.load(std::memory_order_relaxed);
}

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "off") return LogLevel::Off;
    if (lower == "error") return LogLevel::Error;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "info") return LogLevel::Info;
    if (lower == "debug") return LogLevel::Debug;
    return std::nullopt;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Off:     return "off";
        case LogLevel::Error:   return "error";
        case LogLevel::Warning: return "warning";
        case LogLevel::Info:    return "info";
        case LogLevel::Debug:   return "debug";
    }
    return "unknown";
}

void log(LogLevel level, const char* tag, const char* fmt, ...) {
    if (level == LogLevel::Off || level > getLogLevel()) {
        return;
    }

    char message[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    // One write per line so concurrent threads do not interleave
    char line[600];
    snprintf(line, sizeof(line), "[DSPI][%s] %s: %s\n", tag, logLevelName(level), message);

#ifdef _WIN32
    OutputDebugStringA(line);
#else
    fputs(line, stderr);
#endif
}

} // namespace Dspi::Console
