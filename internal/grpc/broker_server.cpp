#include "broker_server.hpp"
#include "grpc_error.hpp"

namespace telemetry::grpc {

BrokerServer::BrokerServer(std::shared_ptr<telemetry::service::BrokerService> svc)
    : service_(std::move(svc)) {}

::grpc::Status BrokerServer::Publish(::grpc::ServerContext*,
                                     const telemetry::monitor::v1::PublishRequest* req,
                                     telemetry::monitor::v1::PublishResponse* resp) {
  try {
    *resp = service_->Publish(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BrokerServer::PublishStream(::grpc::ServerContext*,
                                           ::grpc::ServerReader<telemetry::monitor::v1::PublishRequest>* reader,
                                           telemetry::monitor::v1::PublishResponse* resp) {
  telemetry::monitor::v1::PublishRequest req;
  std::uint64_t deliveries = 0;
  std::uint64_t messages   = 0;
  try {
    while (reader->Read(&req)) {
      deliveries += service_->Publish(req).deliveries();
      ++messages;
    }
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  resp->set_deliveries(deliveries);
  resp->set_messages(messages);
  return ::grpc::Status::OK;
}

}
