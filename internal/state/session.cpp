#include "session.hpp"

#include <cmath>

namespace telemetry::state {

void MeasurementSession::Start() {
  state_        = SessionState::kRunning;
  sample_index_ = 0;
  elapsed_s_    = 0.0;
}

bool MeasurementSession::Stop() {
  if (state_ != SessionState::kRunning) {
    return false;
  }
  state_ = SessionState::kStopped;
  return true;
}

void MeasurementSession::ConfigureDuration(double value, DurationUnit unit) {
  if (!std::isfinite(value) || value <= 0.0) {
    duration_limit_s_.reset();
    return;
  }
  duration_limit_s_ = unit == DurationUnit::kMinutes ? value * 60.0 : value;
}

double MeasurementSession::Advance(double sample_period_s) {
  const double t = static_cast<double>(sample_index_) * sample_period_s;
  ++sample_index_;
  elapsed_s_ = static_cast<double>(sample_index_) * sample_period_s;
  return t;
}

bool MeasurementSession::ShouldAutoStop() const {
  return state_ == SessionState::kRunning && duration_limit_s_.has_value() && elapsed_s_ >= *duration_limit_s_;
}

void MeasurementSession::Finish() {
  state_        = SessionState::kIdle;
  sample_index_ = 0;
  elapsed_s_    = 0.0;
}

void MeasurementSession::Reset() {
  Finish();
  duration_limit_s_.reset();
}

SessionStatus MeasurementSession::Status() const {
  SessionStatus status;
  status.state            = state_;
  status.sample_index     = sample_index_;
  status.elapsed_s        = elapsed_s_;
  status.duration_limit_s = duration_limit_s_;
  return status;
}

} // namespace telemetry::state
