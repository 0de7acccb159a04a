#include <cassert>
#include <iostream>
#include <string>

#include "internal/observability/metrics.hpp"

namespace {

using telemetry::observability::Metrics;

// Attribute values are built from caller strings that die right after each call.
void TestRecordersAcceptShortLivedStrings() {
#ifdef ENABLE_OTEL
  telemetry::observability::OtlpConfig config;
  config.endpoint               = "localhost:4317";
  config.collection_interval_ms = 60000;
  assert(telemetry::observability::InitializeMetrics(config));
#endif

  auto& metrics = Metrics::Instance();
  for (int i = 0; i < 100; ++i) {
    metrics.RecordRequest(std::string("SetSensors-") + std::to_string(i), i % 2 == 0);
    metrics.ObserveRequestLatencyMs(std::string("GetView-") + std::to_string(i), 0.5 * i);
    metrics.RecordSample(std::string("Type") + std::to_string(i), true);
    metrics.RecordSubscriptionFailure(std::string("subscribe-") + std::to_string(i));
  }

#ifdef ENABLE_OTEL
  telemetry::observability::ShutdownMetrics();
#endif
}

} // namespace

int main() {
  TestRecordersAcceptShortLivedStrings();

  std::cout << "telemetry_monitor_unit_metrics: pass\n";
  return 0;
}
