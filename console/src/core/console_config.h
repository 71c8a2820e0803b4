#pragma once

// ==============================================================================
// ConsoleConfig - Runtime Configuration
// ==============================================================================
// Settings are resolved in three passes, later passes overriding earlier ones:
//   1. Built-in defaults (the aggregate initializers below)
//   2. DSPI_* environment variables (DSPI_TIMEOUT_MS, DSPI_LOG_LEVEL, ...)
//   3. --key=value command-line flags (--timeout-ms=500, --log-level=debug)
//
// An invalid value is rejected with a warning and the previous value kept.
// ==============================================================================

#include "core/logging.h"
#include "console_ids.h"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace Dspi::Console {

// IMPORTANT: Field order matters for C++20 designated initializers.
// All designated initializer usage must match this declaration order.
struct ConsoleConfig {
    uint16_t vendorId = kDefaultVendorId;
    uint16_t productId = kDefaultProductId;
    uint32_t transferTimeoutMs = 1000;      // per control transfer
    uint32_t statusPollIntervalMs = 60;     // meters and core load
    uint32_t statsPollIntervalMs = 1000;    // buffer-health counters
    uint32_t settleDelayMs = 100;           // connect -> fetchAll
    LogLevel logLevel = LogLevel::Warning;
};

class ConsoleConfigLoader {
public:
    /// Returns the value of an environment variable, or nullptr
    using EnvironmentLookup = std::function<const char*(const char*)>;

    explicit ConsoleConfigLoader(ConsoleConfig defaults = {});

    /// Apply DSPI_* variables. Defaults to the process environment.
    void applyEnvironment(const EnvironmentLookup& lookup = {});

    /// Apply every --key=value flag and return the remaining arguments in order
    std::vector<std::string> applyArguments(const std::vector<std::string>& args);

    /// Set one option by flag name ("timeout-ms")
    /// @return false for an unknown key or an invalid value (see getLastError)
    bool setValue(std::string_view key, std::string_view value);

    const ConsoleConfig& config() const { return config_; }

    /// Every rejected key or value, in the order encountered
    const std::vector<std::string>& warnings() const { return warnings_; }

    std::string getLastError() const { return lastError_; }

    /// Flag names accepted by setValue()
    static const std::vector<std::string>& optionNames();

    /// "timeout-ms" -> "DSPI_TIMEOUT_MS"
    static std::string environmentName(std::string_view key);

private:
    bool reject(std::string_view key, std::string_view value, const char* reason);

    ConsoleConfig config_;
    std::vector<std::string> warnings_;
    std::string lastError_;
};

} // namespace Dspi::Console
