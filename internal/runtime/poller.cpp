#include "poller.hpp"


#include "internal/core/telemetry_engine.hpp"
#include "internal/discovery/discovery_tracker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace telemetry::runtime {

using telemetry::observability::StringField;

Poller::Poller(std::shared_ptr<telemetry::core::TelemetryEngine> engine, std::shared_ptr<telemetry::discovery::DiscoveryTracker> discovery,
               PollerOptions options)
    : engine_(std::move(engine)), discovery_(std::move(discovery)), options_(options) {
}

Poller::~Poller() {
  Stop();
}

void Poller::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&Poller::Run, this);
}

void Poller::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void Poller::PollOnce(double now_s) {
  engine_->Tick();

  if (!discovery_) {
    return;
  }

  auto result = discovery_->ActiveSensors(now_s, options_.stale_after_s);
  if (result.evicted.empty()) {
    return;
  }

  for (const auto& sensor_id : result.evicted) {
    TELEMETRY_LOG_INFO("Sensor went stale", {StringField("sensor_id", sensor_id)});
  }

  if (options_.drop_stale_selected) {
    engine_->DropSensors(result.evicted);
  }
}

void Poller::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, options_.refresh, [this] { return !running_; })) {
      break;
    }

    lock.unlock();
    try {
      PollOnce(telemetry::util::NowSeconds());
    } catch (const std::exception& e) {
      TELEMETRY_LOG_ERROR("Poll cycle failed", {StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace telemetry::runtime
