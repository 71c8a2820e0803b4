// ==============================================================================
// dspi-console - Command-Line Control for the DSPi Board
// ==============================================================================

#include "app/console_commands.h"
#include "app/console_context.h"
#include "core/console_config.h"
#include "core/logging.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace Dspi::Console;

    ConsoleConfigLoader loader;
    loader.applyEnvironment();
    // Rejected options are logged by the loader and keep their defaults
    const auto args = loader.applyArguments(std::vector<std::string>(argv + 1, argv + argc));
    setLogLevel(loader.config().logLevel);

    if (args.empty()) {
        printUsage(std::cerr);
        return kExitUsage;
    }

    auto context = ConsoleContext::createForDevice(loader.config());
    return runCommand(*context, args, std::cout, std::cerr);
}
