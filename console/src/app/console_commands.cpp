#include "console_commands.h"

#include "app/console_context.h"
#include "version.h"

#include <dspi/dsp/systems/frequency_response.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <optional>
#include <ostream>
#include <string_view>
#include <thread>

namespace Dspi::Console {

using DSP::FilterParams;
using DSP::FilterType;

namespace {

// =============================================================================
// Argument Parsing
// =============================================================================

struct CommandSpec {
    const char* name;
    size_t minArgs;
    size_t maxArgs;
    const char* usage;
};

constexpr size_t kMaxCurvePoints = 10000;
constexpr size_t kMaxMonitorSeconds = 3600;

constexpr CommandSpec kCommands[] = {
    {"info",          0, 0, "info"},
    {"dump",          0, 0, "dump"},
    {"status",        0, 0, "status"},
    {"stats",         0, 0, "stats"},
    {"monitor",       0, 1, "monitor [seconds]"},
    {"set-filter",    6, 6, "set-filter <ch> <band> <type> <freq> <q> <gain>"},
    {"set-delay",     2, 2, "set-delay <ch> <ms>"},
    {"set-preamp",    1, 1, "set-preamp <db>"},
    {"bypass",        1, 1, "bypass on|off"},
    {"set-gain",      2, 2, "set-gain <ch> <db>"},
    {"mute",          2, 2, "mute <ch> on|off"},
    {"clear",         1, 1, "clear <ch>|masters"},
    {"curve",         1, 2, "curve <ch> [points]"},
    {"save",          0, 0, "save"},
    {"load",          0, 0, "load"},
    {"factory-reset", 0, 0, "factory-reset"},
};

const CommandSpec* findCommand(std::string_view name) {
    for (const auto& spec : kCommands) {
        if (name == spec.name) return &spec;
    }
    return nullptr;
}

std::optional<float> parseFloat(const std::string& text) {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    const float value = std::strtof(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value)) return std::nullopt;
    return value;
}

std::optional<size_t> parseCount(std::string_view text) {
    size_t value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parseOnOff(std::string_view text) {
    if (text == "on" || text == "1" || text == "true") return true;
    if (text == "off" || text == "0" || text == "false") return false;
    return std::nullopt;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

/// Accepts a code ("PK"), a name ("peaking", "low-shelf") or a number ("1")
std::optional<FilterType> parseFilterType(std::string_view text) {
    if (auto n = parseCount(text)) {
        if (*n < DSP::kNumFilterTypes) return static_cast<FilterType>(*n);
        return std::nullopt;
    }

    std::string spaced(text);
    std::replace(spaced.begin(), spaced.end(), '-', ' ');
    for (uint32_t raw = 0; raw < DSP::kNumFilterTypes; ++raw) {
        const auto type = static_cast<FilterType>(raw);
        if (equalsIgnoreCase(text, DSP::filterTypeCode(type)) ||
            equalsIgnoreCase(spaced, DSP::filterTypeName(type))) {
            return type;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Output Helpers
// =============================================================================

void printBand(std::ostream& out, size_t band, const FilterParams& p) {
    out << "    " << std::setw(2) << band << "  " << std::left << std::setw(3)
        << DSP::filterTypeCode(p.type) << std::right;
    if (p.isActive()) {
        out << std::fixed << std::setprecision(1)
            << "  " << std::setw(8) << p.frequency << " Hz"
            << "  Q " << std::setprecision(3) << p.Q;
        if (DSP::usesGain(p.type)) {
            out << "  " << std::setprecision(1) << std::showpos << p.gainDb << std::noshowpos << " dB";
        }
    }
    out << '\n';
}

void printDump(std::ostream& out, const StateSnapshot& snap) {
    out << std::fixed << std::setprecision(1)
        << "Preamp: " << snap.global.preampDb << " dB\n"
        << "Bypass: " << (snap.global.bypass ? "on" : "off") << '\n';

    for (Channel ch : kAllChannels) {
        const auto& state = snap.channel(ch);
        out << channelName(ch) << " (" << channelShortName(ch) << ", " << channelDescriptor(ch) << ")";
        if (isOutput(ch)) {
            out << std::fixed << std::setprecision(2)
                << "  delay " << state.delayMs << " ms"
                << std::setprecision(1) << "  gain " << state.gainDb << " dB"
                << (state.muted ? "  MUTED" : "");
        }
        out << '\n';
        for (size_t band = 0; band < state.bands.size(); ++band) {
            printBand(out, band, state.bands[band]);
        }
    }
}

void printStatus(std::ostream& out, const SystemStatus& status) {
    out << "Peaks:";
    for (size_t i = 0; i < status.peaks.size(); ++i) {
        const auto ch = channelFromIndex(i);
        out << "  " << (ch ? channelShortName(*ch) : "?") << " "
            << std::fixed << std::setprecision(1) << status.peaks[i] * 100.0f << "%";
    }
    out << "\nCPU:   core0 " << static_cast<unsigned>(status.cpuLoad[0])
        << "%  core1 " << static_cast<unsigned>(status.cpuLoad[1]) << "%\n";
}

void printStats(std::ostream& out, const BufferStats& stats) {
    for (const auto& counter : kBufferCounters) {
        out << std::left << std::setw(20) << counter.label << std::right
            << stats.*counter.field << '\n';
    }
}

void usageError(std::ostream& err, const char* message, const CommandSpec* spec) {
    err << "Error: " << message << '\n';
    if (spec != nullptr) {
        err << "Usage: dspi-console " << spec->usage << '\n';
    }
}

// =============================================================================
// Parsed Command
// =============================================================================

struct ParsedCommand {
    const CommandSpec* spec = nullptr;
    std::optional<Channel> channel;
    size_t band = 0;
    FilterParams filter;
    float value = 0.0f;
    bool flag = false;
    bool allMasters = false;
    size_t count = 0;
};

/// Validate every argument up front. Errors are reported on @p err.
std::optional<ParsedCommand> parse(const std::vector<std::string>& args, std::ostream& err) {
    ParsedCommand cmd;
    cmd.spec = findCommand(args[0]);
    if (cmd.spec == nullptr) {
        usageError(err, ("unknown command '" + args[0] + "'").c_str(), nullptr);
        return std::nullopt;
    }

    const size_t argc = args.size() - 1;
    if (argc < cmd.spec->minArgs || argc > cmd.spec->maxArgs) {
        usageError(err, "wrong number of arguments", cmd.spec);
        return std::nullopt;
    }

    const std::string_view name = cmd.spec->name;

    // Channel argument (first positional for every channel command)
    if (name == "set-filter" || name == "set-delay" || name == "set-gain" ||
        name == "mute" || name == "curve" || (name == "clear" && args[1] != "masters")) {
        cmd.channel = parseChannel(args[1]);
        if (!cmd.channel) {
            usageError(err, ("unknown channel '" + args[1] + "'").c_str(), cmd.spec);
            return std::nullopt;
        }
    }

    if (name == "set-filter") {
        auto band = parseCount(args[2]);
        auto type = parseFilterType(args[3]);
        auto freq = parseFloat(args[4]);
        auto q = parseFloat(args[5]);
        auto gain = parseFloat(args[6]);
        if (!band || *band >= bandCount(*cmd.channel)) {
            usageError(err, "band out of range for this channel", cmd.spec);
            return std::nullopt;
        }
        if (!type) {
            usageError(err, "type must be OFF, PK, LS, HS, LP or HP", cmd.spec);
            return std::nullopt;
        }
        if (!freq || *freq <= 0.0f || !q || *q <= 0.0f || !gain) {
            usageError(err, "frequency and Q must be positive numbers, gain a number", cmd.spec);
            return std::nullopt;
        }
        cmd.band = *band;
        cmd.filter.type = *type;
        cmd.filter.frequency = *freq;
        cmd.filter.Q = *q;
        cmd.filter.gainDb = *gain;
    } else if (name == "set-delay" || name == "set-gain") {
        if (!isOutput(*cmd.channel)) {
            usageError(err, "only output channels (OL, OR, SUB) have this setting", cmd.spec);
            return std::nullopt;
        }
        auto value = parseFloat(args[2]);
        if (!value) {
            usageError(err, "expected a number", cmd.spec);
            return std::nullopt;
        }
        if (name == "set-delay" && (*value < kMinDelayMs || *value > kMaxDelayMs)) {
            usageError(err, "delay must be between 0 and 170 ms", cmd.spec);
            return std::nullopt;
        }
        cmd.value = *value;
    } else if (name == "set-preamp") {
        auto value = parseFloat(args[1]);
        if (!value || *value < kMinPreampDb || *value > kMaxPreampDb) {
            usageError(err, "preamp must be between -60 and +10 dB", cmd.spec);
            return std::nullopt;
        }
        cmd.value = *value;
    } else if (name == "bypass" || name == "mute") {
        if (name == "mute" && !isOutput(*cmd.channel)) {
            usageError(err, "only output channels (OL, OR, SUB) can be muted", cmd.spec);
            return std::nullopt;
        }
        auto flag = parseOnOff(args.back());
        if (!flag) {
            usageError(err, "expected on or off", cmd.spec);
            return std::nullopt;
        }
        cmd.flag = *flag;
    } else if (name == "clear") {
        cmd.allMasters = !cmd.channel.has_value();
    } else if (name == "curve") {
        cmd.count = DSP::kDefaultResponsePoints;
        if (args.size() > 2) {
            auto count = parseCount(args[2]);
            if (!count || *count < 2 || *count > kMaxCurvePoints) {
                usageError(err, "points must be between 2 and 10000", cmd.spec);
                return std::nullopt;
            }
            cmd.count = *count;
        }
    } else if (name == "monitor") {
        cmd.count = 10;
        if (args.size() > 1) {
            auto seconds = parseCount(args[1]);
            if (!seconds || *seconds == 0 || *seconds > kMaxMonitorSeconds) {
                usageError(err, "seconds must be between 1 and 3600", cmd.spec);
                return std::nullopt;
            }
            cmd.count = *seconds;
        }
    }

    return cmd;
}

int runFlash(ConsoleContext& context, FlashCommand command, std::ostream& out, std::ostream& err) {
    auto& relay = context.persistence();
    const FlashResult result = relay.run(command);

    auto& stream = (relay.lastOutcome() == FlashOutcome::Success ||
                    relay.lastOutcome() == FlashOutcome::Informational) ? out : err;
    stream << relay.getLastMessage() << '\n';

    return result == FlashResult::Ok ? kExitOk : kExitFlashFailed;
}

void runMonitor(ConsoleContext& context, size_t seconds, std::ostream& out) {
    auto& poller = context.poller();
    poller.start();

    for (size_t i = 0; i < seconds && context.session().isConnected(); ++i) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        const auto snap = context.store().snapshot();
        out << "[" << (i + 1) << "s] ";
        printStatus(out, snap.status);
    }

    poller.stop();
}

} // namespace

// =============================================================================
// Public API
// =============================================================================

void printUsage(std::ostream& out) {
    out << DSPI_CONSOLE_NAME << " " << DSPI_CONSOLE_VERSION_STR << "\n\n"
        << "Usage: dspi-console [--key=value ...] <command> [args]\n\n"
        << "Commands:\n";
    for (const auto& spec : kCommands) {
        out << "  " << spec.usage << '\n';
    }
    out << "\nChannels: 0-4 or ML, MR, OL, OR, SUB\n"
        << "Filter types: OFF, PK, LS, HS, LP, HP\n\n"
        << "Options (also DSPI_* environment variables):\n";
    for (const auto& option : ConsoleConfigLoader::optionNames()) {
        out << "  --" << option << "=...  (" << ConsoleConfigLoader::environmentName(option) << ")\n";
    }
}

int runCommand(ConsoleContext& context, const std::vector<std::string>& args,
               std::ostream& out, std::ostream& err) {
    if (args.empty()) {
        printUsage(err);
        return kExitUsage;
    }
    if (args[0] == "help" || args[0] == "--help" || args[0] == "-h") {
        printUsage(out);
        return kExitOk;
    }

    const auto cmd = parse(args, err);
    if (!cmd) {
        return kExitUsage;
    }

    if (!context.connectAndWait()) {
        const auto reason = context.session().getLastError();
        err << (reason.empty() ? "No DSPi device found" : reason) << '\n';
        return kExitNoDevice;
    }

    auto& store = context.store();
    if (!store.fetchAll()) {
        err << "Device stopped responding\n";
        return kExitNoDevice;
    }
    context.poller().cancelPendingFetch();

    const std::string_view name = cmd->spec->name;

    if (name == "info") {
        const auto device = context.session().currentDevice();
        out << DSPI_CONSOLE_NAME << " " << DSPI_CONSOLE_VERSION_STR << '\n'
            << "Device: " << std::hex << std::setfill('0')
            << std::setw(4) << context.config().vendorId << ':'
            << std::setw(4) << context.config().productId
            << std::dec << std::setfill(' ')
            << " at " << (device ? device->path : "?") << '\n';
        for (Channel ch : kAllChannels) {
            out << "  " << channelIndex(ch) << "  " << std::left << std::setw(9) << channelName(ch)
                << std::setw(4) << channelShortName(ch) << std::setw(13) << channelDescriptor(ch)
                << std::right << bandCount(ch) << " bands\n";
        }
        return kExitOk;
    }

    if (name == "dump") {
        printDump(out, store.snapshot());
        return kExitOk;
    }

    if (name == "status") {
        if (!store.pollStatus()) {
            err << "Device stopped responding\n";
            return kExitNoDevice;
        }
        printStatus(out, store.snapshot().status);
        return kExitOk;
    }

    if (name == "stats") {
        auto& reader = context.bufferStats();
        if (reader.poll() == 0) {
            err << "Device stopped responding\n";
            return kExitNoDevice;
        }
        store.updateBufferStats(reader.stats());
        printStats(out, reader.stats());
        return kExitOk;
    }

    if (name == "monitor") {
        runMonitor(context, cmd->count, out);
        return context.session().isConnected() ? kExitOk : kExitNoDevice;
    }

    if (name == "curve") {
        const auto curve = store.channelResponse(*cmd->channel, cmd->count);
        out << std::fixed;
        for (size_t i = 0; i < curve.size(); ++i) {
            out << std::setprecision(1) << DSP::sweepFrequency(i, curve.size()) << '\t'
                << std::setprecision(3) << curve[i] << '\n';
        }
        return kExitOk;
    }

    if (name == "save") return runFlash(context, FlashCommand::Save, out, err);
    if (name == "load") return runFlash(context, FlashCommand::Load, out, err);
    if (name == "factory-reset") return runFlash(context, FlashCommand::FactoryReset, out, err);

    // Writes
    if (name == "set-filter") {
        store.setFilter(*cmd->channel, cmd->band, cmd->filter);
    } else if (name == "set-delay") {
        store.setDelay(*cmd->channel, cmd->value);
    } else if (name == "set-preamp") {
        store.setPreampGain(cmd->value);
    } else if (name == "bypass") {
        store.setBypass(cmd->flag);
    } else if (name == "set-gain") {
        store.setChannelGain(*cmd->channel, cmd->value);
    } else if (name == "mute") {
        store.setChannelMute(*cmd->channel, cmd->flag);
    } else if (name == "clear") {
        if (cmd->allMasters) {
            store.clearMasterBands();
        } else {
            store.clearChannelBands(*cmd->channel);
        }
    }

    // Sets are fire-and-forget; let them reach the device before exiting
    context.session().drain();
    return context.session().isConnected() ? kExitOk : kExitNoDevice;
}

} // namespace Dspi::Console
