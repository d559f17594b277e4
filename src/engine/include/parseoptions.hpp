#pragma once

#include <filesystem>
#include <iostream>
#include <optional>
#include <ostream>
#include <span>
#include <utility>

#include "mdist_string.hpp"

namespace mdist {

template <class OptValueType>
struct ProgramNameAndOptions {
  string programName;
  std::optional<OptValueType> options;
};

/// Parses the command line arguments, program name included.
/// Help (also displayed when no argument is given) and version are printed on 'os', in which case no options are
/// returned as there is nothing else to do.
template <class ParserType>
auto ParseOptions(const ParserType &parser, int argc, const char *argv[], std::ostream &os = std::cout) {
  using OptValueType = ParserType::value_type;

  ProgramNameAndOptions<OptValueType> ret{std::filesystem::path(argv[0]).filename().string(), std::nullopt};

  std::span<const char *const> allArguments(argv, argc);

  // skip first argument which is program name
  auto arguments = allArguments.last(allArguments.size() - 1U);

  auto parsedOptions = parser.parse(arguments);

  if (arguments.empty() || parsedOptions.help) {
    parser.displayHelp(ret.programName, os);
  } else if (parsedOptions.version) {
    OptValueType::PrintVersion(ret.programName, os);
  } else {
    ret.options = std::move(parsedOptions);
  }

  return ret;
}

}  // namespace mdist
