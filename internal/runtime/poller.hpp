#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace telemetry::core {
class TelemetryEngine;
}
namespace telemetry::discovery {
class DiscoveryTracker;
}

namespace telemetry::runtime {

struct PollerOptions {
  std::chrono::milliseconds refresh{250};
  double                    stale_after_s{5.0};
  bool                      drop_stale_selected{true};
};

/*
  Periodic read context.

  Every refresh interval:
      auto-stop check on the session
      discovery eviction, dropping evicted sensors from the selection
*/
class Poller {
 public:
  Poller(std::shared_ptr<telemetry::core::TelemetryEngine> engine, std::shared_ptr<telemetry::discovery::DiscoveryTracker> discovery,
         PollerOptions options);
  ~Poller();

  Poller(const Poller&)            = delete;
  Poller& operator=(const Poller&) = delete;

  void Start();
  void Stop();

  // One poll cycle at `now_s` (monotonic seconds).
  void PollOnce(double now_s);

 private:
  void Run();

  std::shared_ptr<telemetry::core::TelemetryEngine>       engine_;
  std::shared_ptr<telemetry::discovery::DiscoveryTracker> discovery_;
  PollerOptions                                           options_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable cv_;
};

} // namespace telemetry::runtime
