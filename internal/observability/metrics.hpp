#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace telemetry::runtime::config {
class RuntimeConfig;
}

namespace telemetry::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"telemetry-monitor"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t collection_interval_ms{1000};
};

bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeMetrics(const telemetry::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  // accepted=false counts payloads rejected for a missing timestamp or required field.
  void RecordSample(std::string_view sensor_type, bool accepted);
  void RecordSubscriptionFailure(std::string_view operation);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const telemetry::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordSample(std::string_view, bool) {
}

inline void Metrics::RecordSubscriptionFailure(std::string_view) {
}
#endif

} // namespace telemetry::observability
