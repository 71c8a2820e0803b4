#pragma once

// ==============================================================================
// Console Logging
// ==============================================================================
// Tagged, level-filtered printf-style logging. Messages go to stderr, or to
// OutputDebugStringA on Windows, formatted as:
//
//   [DSPI][SESSION] warning: Device busy.
//
// DSPI_TRACE() is the per-transfer trace. It compiles to nothing unless
// DSPI_CONSOLE_TRACE is set to 1 at build time.
// ==============================================================================

#include <cstdint>
#include <optional>
#include <string_view>

#ifndef DSPI_CONSOLE_TRACE
#define DSPI_CONSOLE_TRACE 0
#endif

namespace Dspi::Console {

enum class LogLevel : uint8_t {
    Off = 0,
    Error,
    Warning,
    Info,
    Debug
};

/// Messages above this level are dropped (default: Warning)
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

/// Parse "off", "error", "warning", "info" or "debug" (case-insensitive)
std::optional<LogLevel> parseLogLevel(std::string_view text);

const char* logLevelName(LogLevel level);

/// Format and emit one line. A trailing newline is added.
void log(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace Dspi::Console

#if DSPI_CONSOLE_TRACE
#define DSPI_TRACE(tag, ...) ::Dspi::Console::log(::Dspi::Console::LogLevel::Debug, tag, __VA_ARGS__)
#else
#define DSPI_TRACE(tag, ...) ((void)0)
#endif
