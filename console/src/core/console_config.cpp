#include "console_config.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <optional>

namespace Dspi::Console {

namespace {

constexpr const char* kTag = "CONFIG";

template <typename T>
std::optional<T> parseUnsigned(std::string_view text) {
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
        base = 16;
    }
    if (text.empty()) {
        return std::nullopt;
    }

    uint64_t value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value, base);
    if (ec != std::errc{} || ptr != end || value > std::numeric_limits<T>::max()) {
        return std::nullopt;
    }
    return static_cast<T>(value);
}

} // namespace

ConsoleConfigLoader::ConsoleConfigLoader(ConsoleConfig defaults)
    : config_(defaults)
{
}

const std::vector<std::string>& ConsoleConfigLoader::optionNames() {
    static const std::vector<std::string> names = {
        "vendor-id",
        "product-id",
        "timeout-ms",
        "status-interval-ms",
        "stats-interval-ms",
        "settle-ms",
        "log-level",
    };
    return names;
}

std::string ConsoleConfigLoader::environmentName(std::string_view key) {
    std::string name = "DSPI_";
    for (char c : key) {
        name += (c == '-') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

void ConsoleConfigLoader::applyEnvironment(const EnvironmentLookup& lookup) {
    for (const auto& key : optionNames()) {
        const auto envName = environmentName(key);
        const char* value = lookup ? lookup(envName.c_str()) : std::getenv(envName.c_str());
        if (value != nullptr) {
            setValue(key, value);
        }
    }
}

std::vector<std::string> ConsoleConfigLoader::applyArguments(const std::vector<std::string>& args) {
    std::vector<std::string> remaining;
    for (const auto& arg : args) {
        std::string_view view(arg);
        if (view.size() <= 2 || view.substr(0, 2) != "--") {
            remaining.push_back(arg);
            continue;
        }

        view.remove_prefix(2);
        const auto eq = view.find('=');
        if (eq == std::string_view::npos) {
            reject(view, "", "expected --key=value");
            continue;
        }
        setValue(view.substr(0, eq), view.substr(eq + 1));
    }
    return remaining;
}

bool ConsoleConfigLoader::setValue(std::string_view key, std::string_view value) {
    if (key == "vendor-id" || key == "product-id") {
        auto id = parseUnsigned<uint16_t>(value);
        if (!id) return reject(key, value, "expected a 16-bit id");
        (key == "vendor-id" ? config_.vendorId : config_.productId) = *id;
        return true;
    }

    if (key == "timeout-ms" || key == "status-interval-ms" ||
        key == "stats-interval-ms" || key == "settle-ms") {
        auto ms = parseUnsigned<uint32_t>(value);
        // A zero settle delay is allowed, zero intervals and timeouts are not
        if (!ms || (*ms == 0 && key != "settle-ms")) {
            return reject(key, value, "expected a positive number of milliseconds");
        }
        if (key == "timeout-ms") config_.transferTimeoutMs = *ms;
        else if (key == "status-interval-ms") config_.statusPollIntervalMs = *ms;
        else if (key == "stats-interval-ms") config_.statsPollIntervalMs = *ms;
        else config_.settleDelayMs = *ms;
        return true;
    }

    if (key == "log-level") {
        auto level = parseLogLevel(value);
        if (!level) return reject(key, value, "expected off, error, warning, info or debug");
        config_.logLevel = *level;
        return true;
    }

    return reject(key, value, "unknown option");
}

bool ConsoleConfigLoader::reject(std::string_view key, std::string_view value, const char* reason) {
    lastError_ = "Invalid option '" + std::string(key) + "=" + std::string(value) + "': " + reason;
    warnings_.push_back(lastError_);
    log(LogLevel::Warning, kTag, "%s", lastError_.c_str());
    return false;
}

} // namespace Dspi::Console
