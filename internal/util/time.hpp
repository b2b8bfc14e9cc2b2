#pragma once

#include <chrono>
#include <string>

namespace launcher::util {

/*
  Time utilities. Durations are measured on the monotonic clock.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Groups elapsed times so repeated log lines aggregate:
//   <= 1s      -> 1s
//   < 5s       -> whole seconds
//   5s .. 60s  -> 3 second buckets (6s, 9s, 12s, ...)
//   > 60s      -> nearest minute
std::chrono::nanoseconds TimeBucket(std::chrono::nanoseconds elapsed);

// Renders a duration the way agent logs always have: "6s", "6.4s", "1m30s", "250ms".
std::string FormatDuration(std::chrono::nanoseconds d);

} // namespace launcher::util
