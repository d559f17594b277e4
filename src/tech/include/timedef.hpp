#pragma once

#include <chrono>

namespace mdist {

/// Alias some types to make it easier to use.
/// steady_clock is used as only elapsed times are measured (batch deadlines), never wall clock dates.
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

static constexpr auto kUndefinedDuration = Duration::min();

using seconds = std::chrono::seconds;
using milliseconds = std::chrono::milliseconds;
using microseconds = std::chrono::microseconds;

template <class T>
constexpr T GetTimeDiff(TimePoint tp1, TimePoint tp2) {
  return std::chrono::duration_cast<T>(tp2 - tp1);
}

template <class T>
T GetTimeFrom(TimePoint tp) {
  return GetTimeDiff<T>(tp, Clock::now());
}

}  // namespace mdist
