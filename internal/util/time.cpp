#include "time.hpp"

namespace telemetry::util {

TimePoint Now() {
  return Clock::now();
}

double ToSeconds(TimePoint tp) {
  return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

double NowSeconds() {
  return ToSeconds(Now());
}

} // namespace telemetry::util
