#include "monitor_server.hpp"
#include "grpc_error.hpp"

namespace telemetry::grpc {

MonitorServer::MonitorServer(std::shared_ptr<telemetry::service::MonitorService> svc)
    : service_(std::move(svc)) {}

::grpc::Status MonitorServer::ListSensors(::grpc::ServerContext*,
                                     const google::protobuf::Empty*,
                                     telemetry::monitor::v1::ListSensorsResponse* resp) {
  try {
    *resp = service_->ListSensors();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::ListMetrics(::grpc::ServerContext*,
                                     const telemetry::monitor::v1::ListMetricsRequest* req,
                                     telemetry::monitor::v1::ListMetricsResponse* resp) {
  try {
    *resp = service_->ListMetrics(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::SetSensors(::grpc::ServerContext*,
                                     const telemetry::monitor::v1::SetSensorsRequest* req,
                                     telemetry::monitor::v1::SetSensorsResponse* resp) {
  try {
    *resp = service_->SetSensors(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::SetChannels(::grpc::ServerContext*,
                                     const telemetry::monitor::v1::SetChannelsRequest* req,
                                     telemetry::monitor::v1::SetChannelsResponse* resp) {
  try {
    *resp = service_->SetChannels(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::StartSession(::grpc::ServerContext*,
                                     const google::protobuf::Empty*,
                                     telemetry::monitor::v1::SessionResponse* resp) {
  try {
    *resp = service_->StartSession();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::StopSession(::grpc::ServerContext*,
                                     const google::protobuf::Empty*,
                                     telemetry::monitor::v1::SessionResponse* resp) {
  try {
    *resp = service_->StopSession();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::SaveSeries(::grpc::ServerContext*,
                                     const google::protobuf::Empty*,
                                     telemetry::monitor::v1::SaveSeriesResponse* resp) {
  try {
    *resp = service_->SaveSeries();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::ClearAll(::grpc::ServerContext*,
                                     const google::protobuf::Empty*,
                                     google::protobuf::Empty*) {
  try {
    service_->ClearAll();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::ConfigureDuration(::grpc::ServerContext*,
                                     const telemetry::monitor::v1::ConfigureDurationRequest* req,
                                     telemetry::monitor::v1::SessionResponse* resp) {
  try {
    *resp = service_->ConfigureDuration(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::SelectForDisplay(::grpc::ServerContext*,
                                     const telemetry::monitor::v1::SelectForDisplayRequest* req,
                                     telemetry::monitor::v1::SelectForDisplayResponse* resp) {
  try {
    *resp = service_->SelectForDisplay(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::ListSeries(::grpc::ServerContext*,
                                     const google::protobuf::Empty*,
                                     telemetry::monitor::v1::ListSeriesResponse* resp) {
  try {
    *resp = service_->ListSeries();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::GetView(::grpc::ServerContext*,
                                     const google::protobuf::Empty*,
                                     telemetry::monitor::v1::GetViewResponse* resp) {
  try {
    *resp = service_->GetView();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::ExportCsv(::grpc::ServerContext*,
                                     const telemetry::monitor::v1::ExportCsvRequest* req,
                                     telemetry::monitor::v1::ExportCsvResponse* resp) {
  try {
    *resp = service_->ExportCsv(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
