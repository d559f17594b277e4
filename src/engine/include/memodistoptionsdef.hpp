#pragma once

#include "commandlineoption.hpp"
#include "memodistoptions.hpp"

namespace mdist {

inline constexpr OptionDef<MemodistCmdLineOptions> kMemodistOptionDefs[] = {
    {{OptionGroup::kGeneral, "--help", 'h', "", "Display this information"}, &MemodistCmdLineOptions::help},
    {{OptionGroup::kGeneral, "--version", '\0', "", "Display program version"}, &MemodistCmdLineOptions::version},
    {{OptionGroup::kGeneral, "--data", '\0', "<path/to/data>",
      "Use given 'data' directory instead of the one chosen at build time. It contains the 'static' directory "
      "holding the general configuration file, and the 'log' directory"},
     &MemodistCmdLineOptions::dataDir},
    {{OptionGroup::kGeneral, "--log", 'v', "<levelName|0-6>",
      "Sets the log level in the console during all execution. Possible values are: "
      "(off|critical|error|warning|info|debug|trace) or (0-6) (overrides .log.consoleLevel in general config file)"},
     &MemodistCmdLineOptions::logConsole},
    {{OptionGroup::kGeneral, "--threads", 't', "<n>",
      "Number of threads evaluating memoized computations (overrides .concurrency.nbThreads in general config file)"},
     &MemodistCmdLineOptions::nbThreads},
    {{OptionGroup::kGeneral, "--timeout", '\0', "<time>",
      "Time budget of a batch of memoized computations, for instance '1min30s' or '500ms' (overrides "
      ".concurrency.batchTimeout in general config file)"},
     &MemodistCmdLineOptions::batchTimeout},
    {{OptionGroup::kCommands, "--distance", '\0', "<word1,word2>",
      "Print the Levenshtein edit distance between two words"},
     &MemodistCmdLineOptions::distance},
    {{OptionGroup::kCommands, "--fibonacci", '\0', "<n1,n2,...>",
      "Compute in parallel the Fibonacci numbers of given indexes (from 0 to 93), memoizing all intermediate "
      "results.\nIndexes not computed within the batch timeout are skipped"},
     &MemodistCmdLineOptions::fibonacci},
    {{OptionGroup::kCommands, "--pipeline", '\0', "<payload>",
      "Run an asynchronous pipeline transforming given payload. An empty payload makes the pipeline fail, "
      "in which case the fallback result is printed"},
     &MemodistCmdLineOptions::pipeline}};

}  // namespace mdist
