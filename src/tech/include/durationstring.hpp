#pragma once

#include <string_view>

#include "mdist_string.hpp"
#include "timedef.hpp"

namespace mdist {

/// Parses a duration made of integral amounts of d|h|min|s|ms|us, for instance "1h45min" or "1 h 45 min".
/// Throws invalid_argument if the string is not a valid duration or if it does not fit in a Duration.
Duration ParseDuration(std::string_view durationStr);

/// Representation of given duration with at most 'nbSignificantUnits' units, without spaces: "1h30min".
/// Remaining time smaller than the last displayed unit is truncated.
string DurationToString(Duration dur, int nbSignificantUnits = 2);

}  // namespace mdist
