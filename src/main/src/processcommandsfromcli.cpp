#include "processcommandsfromcli.hpp"

#include <cstdlib>
#include <exception>
#include <sstream>
#include <string_view>

#include "general-config.hpp"
#include "logginginfo.hpp"
#include "mdist_log.hpp"
#include "memodist.hpp"
#include "memodistcommand.hpp"
#include "memodistoptions.hpp"
#include "timedef.hpp"

namespace mdist {

int ProcessCommandsFromCLI(const MemodistCmdLineOptions &cmdLineOptions) {
  schema::GeneralConfig generalConfig = ReadGeneralConfig(cmdLineOptions.dataDir);

  // command line options take precedence over the general config file
  if (!cmdLineOptions.logConsole.empty()) {
    generalConfig.log.consoleLevel = cmdLineOptions.logConsole;
  }
  if (cmdLineOptions.nbThreads != 0) {
    generalConfig.concurrency.nbThreads = cmdLineOptions.nbThreads;
  }

  // Should be outside the try / catch as it holds the RAII object managing the Logging
  LoggingInfo loggingInfo(cmdLineOptions.dataDir, generalConfig.log);

  try {
    const Duration batchTimeout = cmdLineOptions.batchTimeout == kUndefinedDuration ? BatchTimeout(generalConfig)
                                                                                     : cmdLineOptions.batchTimeout;

    Memodist memodist(generalConfig.concurrency.nbThreads, batchTimeout);

    std::ostringstream os;
    const auto nbCommandsProcessed = ProcessMemodistCommands(memodist, cmdLineOptions, os);

    std::string_view output = os.view();
    if (!output.empty() && output.back() == '\n') {
      output.remove_suffix(1U);
    }
    if (!output.empty()) {
      log::get(LoggingInfo::kOutputLoggerName)->info(output);
    }

    log::debug("normal termination after {} command(s) processed", nbCommandsProcessed);
  } catch (const std::exception &e) {
    // Log exception here as LoggingInfo is still configured at this point (will be destroyed immediately afterwards)
    log::critical("{}", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

}  // namespace mdist
