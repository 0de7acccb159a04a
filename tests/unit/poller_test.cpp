#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/catalog/metric_catalog.hpp"
#include "internal/core/telemetry_engine.hpp"
#include "internal/discovery/discovery_tracker.hpp"
#include "internal/runtime/poller.hpp"
#include "internal/state/session.hpp"

namespace {

using telemetry::runtime::Poller;
using telemetry::runtime::PollerOptions;
using telemetry::state::SessionState;

std::shared_ptr<telemetry::core::TelemetryEngine> MakeEngine() {
  return std::make_shared<telemetry::core::TelemetryEngine>(
      std::make_shared<const telemetry::catalog::MetricCatalog>(telemetry::catalog::MetricCatalog::BuiltIn()),
      telemetry::core::EngineOptions{});
}

void TestPollDropsStaleSelectedSensors() {
  auto engine    = MakeEngine();
  auto discovery = std::make_shared<telemetry::discovery::DiscoveryTracker>();
  engine->SetSensors({"SensorMov", "SensorLux"});
  discovery->OnAnnouncement("SensorMov", 100.0);
  discovery->OnAnnouncement("SensorLux", 90.0);

  Poller poller(engine, discovery, PollerOptions{std::chrono::milliseconds(250), 5.0, true});
  poller.PollOnce(100.0);

  assert((engine->SelectedSensors() == std::vector<std::string>{"SensorMov"}));
  assert(discovery->Size() == 1);
}

void TestPollKeepsSelectionWhenDropDisabled() {
  auto engine    = MakeEngine();
  auto discovery = std::make_shared<telemetry::discovery::DiscoveryTracker>();
  engine->SetSensors({"SensorLux"});
  discovery->OnAnnouncement("SensorLux", 0.0);

  Poller poller(engine, discovery, PollerOptions{std::chrono::milliseconds(250), 5.0, false});
  poller.PollOnce(100.0);

  assert(discovery->Size() == 0);
  assert(engine->SelectedSensors().size() == 1);
}

void TestPollAutoStopsSession() {
  auto engine = MakeEngine();
  engine->SetSensors({"SensorLux"});
  engine->ConfigureDuration(0.5, telemetry::state::DurationUnit::kSeconds);
  engine->Start();
  engine->OnMessage("EQ1/SensorLux/data", R"({"t_ms":0,"Lux":1})");
  engine->OnMessage("EQ1/SensorLux/data", R"({"t_ms":0,"Lux":1})");

  Poller poller(engine, nullptr, PollerOptions{});
  poller.PollOnce(0.0);
  assert(engine->Status().state == SessionState::kStopped);
}

void TestBackgroundLoopTicks() {
  auto engine = MakeEngine();
  engine->SetSensors({"SensorLux"});
  engine->ConfigureDuration(0.25, telemetry::state::DurationUnit::kSeconds);
  engine->Start();
  engine->OnMessage("EQ1/SensorLux/data", R"({"t_ms":0,"Lux":1})");

  Poller poller(engine, std::make_shared<telemetry::discovery::DiscoveryTracker>(), PollerOptions{std::chrono::milliseconds(10), 5.0, true});
  poller.Start();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (engine->Status().state == SessionState::kRunning && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  poller.Stop();
  poller.Stop();

  assert(engine->Status().state == SessionState::kStopped);
}

} // namespace

int main() {
  TestPollDropsStaleSelectedSensors();
  TestPollKeepsSelectionWhenDropDisabled();
  TestPollAutoStopsSession();
  TestBackgroundLoopTicks();

  std::cout << "telemetry_monitor_unit_poller: pass\n";
  return 0;
}
