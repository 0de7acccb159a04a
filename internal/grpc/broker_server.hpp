#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/broker_service.hpp"
#include "telemetry/monitor/v1.hpp"

namespace telemetry::grpc {

class BrokerServer final : public telemetry::monitor::v1::TelemetryBrokerService::Service {
public:
  explicit BrokerServer(std::shared_ptr<telemetry::service::BrokerService> svc);

  ::grpc::Status Publish(::grpc::ServerContext*, const telemetry::monitor::v1::PublishRequest*,
                         telemetry::monitor::v1::PublishResponse*) override;

  ::grpc::Status PublishStream(::grpc::ServerContext*,
                               ::grpc::ServerReader<telemetry::monitor::v1::PublishRequest>* reader,
                               telemetry::monitor::v1::PublishResponse*) override;

private:
  std::shared_ptr<telemetry::service::BrokerService> service_;
};

}
