#pragma once

#include <chrono>

namespace telemetry::util {

/*
  Time utilities. Single place to control the clock source.

  Discovery and the poller work on monotonic seconds so that wall clock
  adjustments never evict a live sensor.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Seconds since the clock epoch, as used by the discovery tracker.
double ToSeconds(TimePoint tp);
double NowSeconds();

} // namespace telemetry::util
