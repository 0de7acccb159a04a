#pragma once

#include <cstdint>
#include <optional>

namespace telemetry::state {

enum class SessionState : std::uint8_t {
  kIdle    = 0,
  kRunning = 1,
  kStopped = 2,
};

enum class DurationUnit : std::uint8_t {
  kSeconds = 0,
  kMinutes = 1,
};

constexpr const char* ToString(SessionState state) {
  switch (state) {
    case SessionState::kIdle:
      return "idle";
    case SessionState::kRunning:
      return "running";
    case SessionState::kStopped:
      return "stopped";
  }
  return "unknown";
}

struct SessionStatus {
  SessionState          state{SessionState::kIdle};
  std::uint64_t         sample_index{0};
  double                elapsed_s{0.0};
  std::optional<double> duration_limit_s;
};

/*
  Idle -> Running -> (Stop | duration reached) -> Stopped -> Running ...

  The sample index is the only source of the time axis: the n-th accepted
  sample of a session is stamped (n - 1) * period.
*/
class MeasurementSession {
 public:
  void Start();

  // No-op unless running. Returns true when the state changed.
  bool Stop();

  // value <= 0 means unbounded.
  void ConfigureDuration(double value, DurationUnit unit);

  // Stamps the next sample and advances the index.
  double Advance(double sample_period_s);

  bool ShouldAutoStop() const;

  // Back to Idle after archiving; keeps the duration limit.
  void Finish();

  // Back to Idle and unbounded.
  void Reset();

  SessionState state() const {
    return state_;
  }
  bool running() const {
    return state_ == SessionState::kRunning;
  }
  std::uint64_t sample_index() const {
    return sample_index_;
  }
  double elapsed_s() const {
    return elapsed_s_;
  }
  std::optional<double> duration_limit_s() const {
    return duration_limit_s_;
  }

  SessionStatus Status() const;

 private:
  SessionState          state_{SessionState::kIdle};
  std::uint64_t         sample_index_{0};
  double                elapsed_s_{0.0};
  std::optional<double> duration_limit_s_;
};

} // namespace telemetry::state
