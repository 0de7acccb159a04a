#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/monitor_service.hpp"
#include "telemetry/monitor/v1.hpp"

namespace telemetry::grpc {

class MonitorServer final : public telemetry::monitor::v1::TelemetryMonitorService::Service {
public:
  explicit MonitorServer(std::shared_ptr<telemetry::service::MonitorService> svc);

  ::grpc::Status ListSensors(::grpc::ServerContext*, const google::protobuf::Empty*,
                             telemetry::monitor::v1::ListSensorsResponse*) override;

  ::grpc::Status ListMetrics(::grpc::ServerContext*, const telemetry::monitor::v1::ListMetricsRequest*,
                             telemetry::monitor::v1::ListMetricsResponse*) override;

  ::grpc::Status SetSensors(::grpc::ServerContext*, const telemetry::monitor::v1::SetSensorsRequest*,
                            telemetry::monitor::v1::SetSensorsResponse*) override;

  ::grpc::Status SetChannels(::grpc::ServerContext*, const telemetry::monitor::v1::SetChannelsRequest*,
                             telemetry::monitor::v1::SetChannelsResponse*) override;

  ::grpc::Status StartSession(::grpc::ServerContext*, const google::protobuf::Empty*,
                              telemetry::monitor::v1::SessionResponse*) override;

  ::grpc::Status StopSession(::grpc::ServerContext*, const google::protobuf::Empty*,
                             telemetry::monitor::v1::SessionResponse*) override;

  ::grpc::Status SaveSeries(::grpc::ServerContext*, const google::protobuf::Empty*,
                            telemetry::monitor::v1::SaveSeriesResponse*) override;

  ::grpc::Status ClearAll(::grpc::ServerContext*, const google::protobuf::Empty*,
                          google::protobuf::Empty*) override;

  ::grpc::Status ConfigureDuration(::grpc::ServerContext*, const telemetry::monitor::v1::ConfigureDurationRequest*,
                                   telemetry::monitor::v1::SessionResponse*) override;

  ::grpc::Status SelectForDisplay(::grpc::ServerContext*, const telemetry::monitor::v1::SelectForDisplayRequest*,
                                  telemetry::monitor::v1::SelectForDisplayResponse*) override;

  ::grpc::Status ListSeries(::grpc::ServerContext*, const google::protobuf::Empty*,
                            telemetry::monitor::v1::ListSeriesResponse*) override;

  ::grpc::Status GetView(::grpc::ServerContext*, const google::protobuf::Empty*,
                         telemetry::monitor::v1::GetViewResponse*) override;

  ::grpc::Status ExportCsv(::grpc::ServerContext*, const telemetry::monitor::v1::ExportCsvRequest*,
                           telemetry::monitor::v1::ExportCsvResponse*) override;

private:
  std::shared_ptr<telemetry::service::MonitorService> service_;
};

}
