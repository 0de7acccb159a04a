#pragma once

#include "service_context.hpp"
#include "telemetry/monitor/v1.hpp"

namespace telemetry::service {

/*
  Publish entry point for sensors and test tools.
*/
class BrokerService {
public:
  explicit BrokerService(ServiceContext ctx);

  telemetry::monitor::v1::PublishResponse
  Publish(const telemetry::monitor::v1::PublishRequest& req);

private:
  ServiceContext ctx_;
};

}
