#include "memodistcommand.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>

#include "mdist_exception.hpp"
#include "mdist_invalid_argument_exception.hpp"
#include "mdist_log.hpp"
#include "mdist_vector.hpp"
#include "memodist.hpp"
#include "memodistoptions.hpp"
#include "stringconv.hpp"

namespace mdist {

namespace {
constexpr char kArgSep = ',';

vector<std::string_view> Split(std::string_view arg) {
  vector<std::string_view> ret;
  for (auto sepPos = arg.find(kArgSep); sepPos != std::string_view::npos; sepPos = arg.find(kArgSep)) {
    ret.push_back(arg.substr(0, sepPos));
    arg.remove_prefix(sepPos + 1);
  }
  ret.push_back(arg);
  return ret;
}
}  // namespace

void DistanceCommand::execute(std::string_view arg, std::ostream &os) {
  const auto words = Split(arg);
  if (words.size() != 2) {
    throw invalid_argument("Expecting exactly two words separated by '{}' instead of '{}'", kArgSep, arg);
  }
  os << "Levenshtein('" << words[0] << "','" << words[1] << "') = " << memodist().distance(words[0], words[1])
     << '\n';
}

void FibonacciCommand::execute(std::string_view arg, std::ostream &os) {
  vector<int> indexes;
  for (std::string_view indexStr : Split(arg)) {
    try {
      indexes.push_back(StringToIntegral(indexStr));
    } catch (const exception &) {
      throw invalid_argument("Invalid Fibonacci index '{}'", indexStr);
    }
  }

  const auto values = memodist().fibonacciBatch(indexes);

  os << "Fibonacci (memoized): [";
  for (decltype(values.size()) pos = 0; pos < values.size(); ++pos) {
    if (pos != 0) {
      os << ", ";
    }
    os << values[pos];
  }
  os << "]\n";
}

void PipelineCommand::execute(std::string_view arg, std::ostream &os) {
  os << "Pipeline result: " << memodist().pipeline(arg) << '\n';
}

const MemodistCommandRegistry &GetMemodistCommandRegistry() {
  static const MemodistCommandRegistry kRegistry = [] {
    MemodistCommandRegistry registry;
    registry.registerType<DistanceCommand>("distance")
        .registerType<FibonacciCommand>("fibonacci")
        .registerType<PipelineCommand>("pipeline");
    return registry;
  }();
  return kRegistry;
}

int ProcessMemodistCommands(Memodist &memodist, const MemodistCmdLineOptions &options, std::ostream &os) {
  const std::pair<std::string_view, std::optional<std::string_view>> commandsWithArg[] = {
      {"distance", options.distance.empty() ? std::nullopt : std::optional<std::string_view>(options.distance)},
      {"fibonacci", options.fibonacci.empty() ? std::nullopt : std::optional<std::string_view>(options.fibonacci)},
      {"pipeline", options.pipeline}};

  const auto &registry = GetMemodistCommandRegistry();

  int nbProcessedCommands = 0;
  for (const auto &[commandName, optArg] : commandsWithArg) {
    if (!optArg) {
      continue;
    }
    auto pCommand = registry.create(commandName, memodist);
    if (!pCommand) {
      throw exception("Command {} is not registered", commandName);
    }
    log::debug("Processing command {} with argument '{}'", commandName, *optArg);
    pCommand->execute(*optArg, os);
    ++nbProcessedCommands;
  }
  return nbProcessedCommands;
}

}  // namespace mdist
