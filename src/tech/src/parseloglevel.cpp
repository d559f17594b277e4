#include "parseloglevel.hpp"

#include <cstdint>
#include <iterator>
#include <string_view>

#include "mdist_exception.hpp"

namespace mdist {

namespace {
constexpr std::string_view kLogLevelNames[] = {"off", "critical", "error", "warning", "info", "debug", "trace"};
constexpr auto kNbLogLevels = static_cast<int8_t>(std::size(kLogLevelNames));
}  // namespace

int8_t LogPosFromLogStr(std::string_view logStr) {
  if (logStr.size() == 1) {
    const int8_t logLevelPos = static_cast<int8_t>(logStr.front() - '0');
    if (logLevelPos < 0 || logLevelPos >= kNbLogLevels) {
      throw exception("Unrecognized log level {}. Possible values are [0-{}]", logStr, kNbLogLevels - 1);
    }
    return logLevelPos;
  }

  int8_t logLevel = 0;
  for (const auto logName : kLogLevelNames) {
    if (logStr == logName) {
      return logLevel;
    }
    ++logLevel;
  }

  throw exception("Unrecognized log level name {}. Possible values are off|critical|error|warning|info|debug|trace",
                  logStr);
}

}  // namespace mdist
