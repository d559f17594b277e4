#include "durationstring.hpp"

#include <chrono>
#include <string_view>

#include "mdist_string.hpp"
#include "timedef.hpp"
#include "unitsparser.hpp"

namespace mdist {

namespace {

template <class ChronoDuration>
constexpr AmountUnit DurationUnit(std::string_view symbol) {
  return {symbol, std::chrono::duration_cast<Duration>(ChronoDuration(1)).count()};
}

constexpr AmountUnit kDurationUnits[] = {
    DurationUnit<std::chrono::days>("d"),          DurationUnit<std::chrono::hours>("h"),
    DurationUnit<std::chrono::minutes>("min"),     DurationUnit<std::chrono::seconds>("s"),
    DurationUnit<std::chrono::milliseconds>("ms"), DurationUnit<std::chrono::microseconds>("us")};

constexpr std::string_view kUndefinedDurationStr = "<undef>";

}  // namespace

Duration ParseDuration(std::string_view durationStr) {
  return Duration(ParseAmountWithUnits(durationStr, kDurationUnits, "duration"));
}

string DurationToString(Duration dur, int nbSignificantUnits) {
  if (dur == kUndefinedDuration) {
    return string(kUndefinedDurationStr);
  }
  string ret;
  AppendAmountWithUnits(dur.count(), kDurationUnits, nbSignificantUnits, ret);
  return ret;
}

}  // namespace mdist
