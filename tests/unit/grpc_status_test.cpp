#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/catalog/metric_catalog.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/telemetry_engine.hpp"
#include "internal/discovery/discovery_tracker.hpp"
#include "internal/grpc/broker_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/monitor_server.hpp"
#include "internal/service/broker_service.hpp"
#include "internal/service/monitor_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/transport/broker.hpp"
#include "internal/transport/broker_client.hpp"
#include "internal/util/errors.hpp"
#include "telemetry/monitor/v1.hpp"

namespace {

using namespace telemetry::monitor::v1;

telemetry::service::ServiceContext BuildServiceContext() {
  telemetry::service::ServiceContext ctx;
  ctx.engine = std::make_shared<telemetry::core::TelemetryEngine>(
      std::make_shared<const telemetry::catalog::MetricCatalog>(telemetry::catalog::MetricCatalog::BuiltIn()),
      telemetry::core::EngineOptions{});
  ctx.discovery = std::make_shared<telemetry::discovery::DiscoveryTracker>();
  ctx.broker    = std::make_shared<telemetry::transport::Broker>();
  ctx.config    = std::make_shared<const telemetry::runtime::config::RuntimeConfig>(telemetry::config::ConfigLoader::LoadFromYamlString(""));
  return ctx;
}

void TestExceptionMapping() {
  using telemetry::grpc::ToStatus;
  assert(ToStatus(telemetry::util::InvalidSelection("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(telemetry::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(telemetry::util::EmptyRecording("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(telemetry::util::SubscriptionError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(telemetry::util::EmptyRecording("nothing")).error_message() == "nothing");
}

void TestSensorWithoutMetricsReturnsInvalidArgument() {
  auto                            ctx = BuildServiceContext();
  telemetry::grpc::MonitorServer  server(std::make_shared<telemetry::service::MonitorService>(ctx));
  ::grpc::ServerContext           server_context;
  SetSensorsRequest               req;
  SetSensorsResponse              resp;
  req.add_sensor_ids("SensorUnknown");

  const auto status = server.SetSensors(&server_context, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ctx.engine->SelectedSensors().empty());
}

void TestEmptyChannelRequestReturnsInvalidArgument() {
  auto                           ctx = BuildServiceContext();
  telemetry::grpc::MonitorServer server(std::make_shared<telemetry::service::MonitorService>(ctx));
  ::grpc::ServerContext          server_context;
  ctx.engine->SetSensors({"SensorMov"});

  SetChannelsRequest  empty_req;
  SetChannelsResponse resp;
  assert(server.SetChannels(&server_context, &empty_req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  SetChannelsRequest req;
  req.add_channels()->set_sensor_id("SensorMov");
  assert(server.SetChannels(&server_context, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ctx.engine->ActiveIds().size() == 3);
}

void TestSaveWithoutSamplesReturnsFailedPrecondition() {
  auto                           ctx = BuildServiceContext();
  telemetry::grpc::MonitorServer server(std::make_shared<telemetry::service::MonitorService>(ctx));
  ::grpc::ServerContext          server_context;
  google::protobuf::Empty        empty;
  SaveSeriesResponse             resp;

  const auto status = server.SaveSeries(&server_context, &empty, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestExportWithoutSeriesReturnsFailedPrecondition() {
  auto                           ctx = BuildServiceContext();
  telemetry::grpc::MonitorServer server(std::make_shared<telemetry::service::MonitorService>(ctx));
  ::grpc::ServerContext          server_context;
  ExportCsvRequest               req;
  ExportCsvResponse              resp;

  const auto status = server.ExportCsv(&server_context, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestPublishToWildcardReturnsInvalidArgument() {
  auto                          ctx = BuildServiceContext();
  telemetry::grpc::BrokerServer server(std::make_shared<telemetry::service::BrokerService>(ctx));
  ::grpc::ServerContext         server_context;
  PublishRequest                req;
  PublishResponse               resp;
  req.set_topic("EQ1/+/data");
  req.set_payload("{}");

  assert(server.Publish(&server_context, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_topic("EQ1/SensorMov/data");
  const auto status = server.Publish(&server_context, &req, &resp);
  assert(status.ok());
  assert(resp.deliveries() == 0);
  assert(resp.messages() == 1);
}

void TestBrokerServiceKeepsErrorType() {
  auto                              ctx = BuildServiceContext();
  telemetry::service::BrokerService service(ctx);

  telemetry::transport::BrokerClient client(ctx.broker, "listener");
  assert(client.Connect(telemetry::transport::ConnectOptions{}) == telemetry::transport::kConnectionAccepted);
  client.Subscribe("EQ1/+/data");

  PublishRequest req;
  req.set_topic("EQ1/#");
  bool threw = false;
  try {
    service.Publish(req);
  } catch (const telemetry::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  req.set_topic("EQ1/SensorLux/data");
  req.set_payload(R"({"t_ms":0})");
  assert(service.Publish(req).deliveries() == 1);
  client.Disconnect();
}

} // namespace

int main() {
  TestExceptionMapping();
  TestSensorWithoutMetricsReturnsInvalidArgument();
  TestEmptyChannelRequestReturnsInvalidArgument();
  TestSaveWithoutSamplesReturnsFailedPrecondition();
  TestExportWithoutSeriesReturnsFailedPrecondition();
  TestPublishToWildcardReturnsInvalidArgument();
  TestBrokerServiceKeepsErrorType();

  std::cout << "telemetry_monitor_unit_grpc_status: pass\n";
  return 0;
}
