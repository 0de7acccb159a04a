#pragma once

#include <memory>

namespace telemetry::core { class TelemetryEngine; }
namespace telemetry::discovery { class DiscoveryTracker; }
namespace telemetry::transport { class Broker; }
namespace telemetry::runtime::config { class RuntimeConfig; }

namespace telemetry::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<telemetry::core::TelemetryEngine> engine;
  std::shared_ptr<telemetry::discovery::DiscoveryTracker> discovery;
  std::shared_ptr<telemetry::transport::Broker> broker;
  std::shared_ptr<const telemetry::runtime::config::RuntimeConfig> config;
};

}
