#pragma once

// ==============================================================================
// Console Commands
// ==============================================================================
// The dspi-console command set. Arguments are validated before the device is
// touched, so a usage error never opens the device.
// ==============================================================================

#include <iosfwd>
#include <string>
#include <vector>

namespace Dspi::Console {

class ConsoleContext;

enum ExitCode : int {
    kExitOk = 0,
    kExitUsage = 1,
    kExitNoDevice = 2,
    kExitFlashFailed = 3
};

void printUsage(std::ostream& out);

/// Run one command (args[0] is the command name, flags already removed)
/// @return process exit code
int runCommand(ConsoleContext& context, const std::vector<std::string>& args,
               std::ostream& out, std::ostream& err);

} // namespace Dspi::Console
