#pragma once

#include "memodistoptions.hpp"

namespace mdist {

/// Sets up logging from general configuration and command line options, and processes the commands.
/// Returns the exit code of the program.
int ProcessCommandsFromCLI(const MemodistCmdLineOptions &cmdLineOptions);

}  // namespace mdist
