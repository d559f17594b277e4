#pragma once

#include <optional>
#include <ostream>
#include <string_view>

#include "mdist_const.hpp"
#include "timedef.hpp"

namespace mdist {

struct MemodistCmdLineOptions {
  static std::ostream& PrintVersion(std::string_view programName, std::ostream& os) noexcept;

  /// Tells whether at least one command is asked.
  bool hasCommands() const { return !distance.empty() || !fibonacci.empty() || pipeline.has_value(); }

  std::string_view dataDir = kDefaultDataDir;
  std::string_view logConsole;

  std::string_view distance;
  std::string_view fibonacci;
  std::optional<std::string_view> pipeline;

  Duration batchTimeout = kUndefinedDuration;

  int nbThreads = 0;

  bool help = false;
  bool version = false;
};

}  // namespace mdist
