#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace telemetry::core { class TelemetryEngine; }
namespace telemetry::discovery { class DiscoveryTracker; }
namespace telemetry::runtime { class Poller; }
namespace telemetry::transport {
class Broker;
class BrokerClient;
}

namespace telemetry::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<telemetry::transport::Broker>           broker;
  std::shared_ptr<telemetry::transport::BrokerClient>     measurement_client;
  std::shared_ptr<telemetry::transport::BrokerClient>     supervisor_client;
  std::shared_ptr<telemetry::core::TelemetryEngine>       engine;
  std::shared_ptr<telemetry::discovery::DiscoveryTracker> discovery;
  std::shared_ptr<telemetry::runtime::Poller>             poller;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  // Stops background work: poller first, then the broker clients.
  void Shutdown();
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place that wires transports to the engine.
*/
Application Build(const telemetry::runtime::config::RuntimeConfig& config);

} // namespace telemetry::factory
