#pragma once

#include <cstdint>
#include <string_view>

namespace mdist {

/// Parses a log level given either by its position (from '0' for off to '6' for trace) or by its name
/// (off|critical|error|warning|info|debug|trace).
/// Throws mdist::exception if not recognized.
int8_t LogPosFromLogStr(std::string_view logStr);

}  // namespace mdist
