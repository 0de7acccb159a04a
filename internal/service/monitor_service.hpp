#pragma once

#include <google/protobuf/empty.pb.h>

#include "service_context.hpp"
#include "telemetry/monitor/v1.hpp"

namespace telemetry::service {

class MonitorService {
public:
  explicit MonitorService(ServiceContext ctx);

  telemetry::monitor::v1::ListSensorsResponse ListSensors();

  telemetry::monitor::v1::ListMetricsResponse
  ListMetrics(const telemetry::monitor::v1::ListMetricsRequest& req);

  telemetry::monitor::v1::SetSensorsResponse
  SetSensors(const telemetry::monitor::v1::SetSensorsRequest& req);

  telemetry::monitor::v1::SetChannelsResponse
  SetChannels(const telemetry::monitor::v1::SetChannelsRequest& req);

  telemetry::monitor::v1::SessionResponse StartSession();
  telemetry::monitor::v1::SessionResponse StopSession();

  telemetry::monitor::v1::SessionResponse
  ConfigureDuration(const telemetry::monitor::v1::ConfigureDurationRequest& req);

  telemetry::monitor::v1::SaveSeriesResponse SaveSeries();
  void ClearAll();

  telemetry::monitor::v1::SelectForDisplayResponse
  SelectForDisplay(const telemetry::monitor::v1::SelectForDisplayRequest& req);

  telemetry::monitor::v1::ListSeriesResponse ListSeries();
  telemetry::monitor::v1::GetViewResponse GetView();

  telemetry::monitor::v1::ExportCsvResponse
  ExportCsv(const telemetry::monitor::v1::ExportCsvRequest& req);

private:
  ServiceContext ctx_;
};

}
