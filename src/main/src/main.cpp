#include <cstdlib>
#include <exception>
#include <iostream>

#include "commandlineoptionsparser.hpp"
#include "mdist_invalid_argument_exception.hpp"
#include "memodistoptions.hpp"
#include "memodistoptionsdef.hpp"
#include "parseoptions.hpp"
#include "processcommandsfromcli.hpp"

int main(int argc, const char* argv[]) {
  using namespace mdist;
  try {
    const CommandLineOptionsParser<MemodistCmdLineOptions> parser(kMemodistOptionDefs);
    const auto [programName, cmdLineOptions] = ParseOptions(parser, argc, argv);

    if (cmdLineOptions) {
      if (!cmdLineOptions->hasCommands()) {
        std::cerr << "No command given, see '" << programName << " --help'\n";
        return EXIT_FAILURE;
      }
      return ProcessCommandsFromCLI(*cmdLineOptions);
    }
  } catch (const invalid_argument& e) {
    std::cerr << "Invalid argument: " << e.what() << '\n';
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    std::cerr << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
