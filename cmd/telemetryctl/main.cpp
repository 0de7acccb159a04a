#include <grpcpp/grpcpp.h>

#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "telemetry/monitor/v1.hpp"

using namespace telemetry::monitor::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  telemetryctl <addr> sensors\n"
            << "  telemetryctl <addr> metrics [sensor_id...]\n"
            << "  telemetryctl <addr> select [sensor_id...]\n"
            << "  telemetryctl <addr> channels <sensor_id> <metric_id...>\n"
            << "  telemetryctl <addr> start\n"
            << "  telemetryctl <addr> stop\n"
            << "  telemetryctl <addr> duration <value> [s|min]\n"
            << "  telemetryctl <addr> save\n"
            << "  telemetryctl <addr> clear\n"
            << "  telemetryctl <addr> display [series_name]\n"
            << "  telemetryctl <addr> series\n"
            << "  telemetryctl <addr> view\n"
            << "  telemetryctl <addr> export [file|--server]\n"
            << "  telemetryctl <addr> publish <topic> <json>\n";
}

static const char* StateName(SessionState state) {
  switch (state) {
    case SESSION_STATE_IDLE:
      return "idle";
    case SESSION_STATE_RUNNING:
      return "running";
    case SESSION_STATE_STOPPED:
      return "stopped";
    default:
      return "unknown";
  }
}

static void PrintSession(const SessionStatus& session) {
  std::cout << "state=" << StateName(session.state()) << " samples=" << session.sample_index() << " elapsed_s=" << session.elapsed_s();
  if (session.has_duration_limit_s()) {
    std::cout << " limit_s=" << session.duration_limit_s();
  }
  std::cout << "\n";
}

static std::optional<DurationUnit> ParseUnit(const std::string& value) {
  if (value == "s" || value == "sec" || value == "seconds") {
    return DURATION_UNIT_SECONDS;
  }
  if (value == "min" || value == "minutes") {
    return DURATION_UNIT_MINUTES;
  }
  return std::nullopt;
}

static std::optional<double> ParseNumber(const std::string& text) {
  try {
    std::size_t used  = 0;
    const double value = std::stod(text, &used);
    if (used != text.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto monitor_stub = TelemetryMonitorService::NewStub(channel);
  auto broker_stub  = TelemetryBrokerService::NewStub(channel);

  grpc::ClientContext     ctx;
  google::protobuf::Empty empty;

  // ------------------------------------------------------------

  if (cmd == "sensors") {
    ListSensorsResponse resp;

    auto status = monitor_stub->ListSensors(&ctx, empty, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& sensor : resp.sensors()) {
      std::cout << (sensor.selected() ? "* " : "  ") << sensor.sensor_id() << " type=" << sensor.type() << " name=\"" << sensor.display_name()
                << "\" age_s=" << std::fixed << std::setprecision(1) << sensor.age_s() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "metrics") {
    ListMetricsRequest req;
    for (int i = 3; i < argc; ++i) {
      req.add_sensor_ids(argv[i]);
    }

    ListMetricsResponse resp;

    auto status = monitor_stub->ListMetrics(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& metric : resp.metrics()) {
      std::cout << (metric.active() ? "* " : "  ") << metric.qualified_id() << " label=\"" << metric.label() << "\" unit=" << metric.unit()
                << " scale=" << metric.scale() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "select") {
    SetSensorsRequest req;
    for (int i = 3; i < argc; ++i) {
      req.add_sensor_ids(argv[i]);
    }

    SetSensorsResponse resp;

    auto status = monitor_stub->SetSensors(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "selected=" << resp.selected_sensors_size() << " active_metrics=" << resp.active_metric_ids_size()
              << (resp.reset() ? " (reset)" : "") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "channels") {
    if (argc < 5) return 1;

    SetChannelsRequest req;
    auto*              selection = req.add_channels();
    selection->set_sensor_id(argv[3]);
    for (int i = 4; i < argc; ++i) {
      selection->add_metric_ids(argv[i]);
    }

    SetChannelsResponse resp;

    auto status = monitor_stub->SetChannels(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& id : resp.active_metric_ids()) {
      std::cout << id << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "start" || cmd == "stop") {
    SessionResponse resp;

    auto status = cmd == "start" ? monitor_stub->StartSession(&ctx, empty, &resp) : monitor_stub->StopSession(&ctx, empty, &resp);
    if (!status.ok()) return Fail(status);

    PrintSession(resp.session());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "duration") {
    if (argc < 4) return 1;

    auto value = ParseNumber(argv[3]);
    if (!value.has_value()) {
      std::cerr << "invalid duration value: " << argv[3] << "\n";
      Usage();
      return 1;
    }

    ConfigureDurationRequest req;
    req.set_value(value.value());
    req.set_unit(DURATION_UNIT_SECONDS);
    if (argc >= 5) {
      auto unit = ParseUnit(argv[4]);
      if (!unit.has_value()) {
        std::cerr << "unsupported unit: " << argv[4] << "\n";
        return 1;
      }
      req.set_unit(unit.value());
    }

    SessionResponse resp;

    auto status = monitor_stub->ConfigureDuration(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintSession(resp.session());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "save") {
    SaveSeriesResponse resp;

    auto status = monitor_stub->SaveSeries(&ctx, empty, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.name() << " samples=" << resp.samples() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "clear") {
    google::protobuf::Empty resp;

    auto status = monitor_stub->ClearAll(&ctx, empty, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cleared\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "display") {
    SelectForDisplayRequest req;
    if (argc >= 4) {
      // Series names contain a space: "Series 1".
      std::string name = argv[3];
      for (int i = 4; i < argc; ++i) {
        name += " ";
        name += argv[i];
      }
      req.set_name(name);
    }

    SelectForDisplayResponse resp;

    auto status = monitor_stub->SelectForDisplay(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.live() ? std::string("live") : resp.series_name()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "series") {
    ListSeriesResponse resp;

    auto status = monitor_stub->ListSeries(&ctx, empty, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& name : resp.names()) {
      std::cout << name << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "view") {
    GetViewResponse resp;

    auto status = monitor_stub->GetView(&ctx, empty, &resp);
    if (!status.ok()) return Fail(status);

    const auto& view = resp.view();
    std::cout << (view.live() ? std::string("live") : view.series_name()) << " samples=" << view.times_size();
    if (view.has_last_time()) {
      std::cout << " t_s=" << view.last_time();
    }
    if (view.has_dropped_count()) {
      std::cout << " dropped=" << view.dropped_count();
    }
    std::cout << "\n";
    PrintSession(view.session());
    for (const auto& metric : view.metrics()) {
      std::cout << "  " << metric.qualified_id() << " = ";
      if (metric.last().has_value()) {
        std::cout << metric.last().value();
      } else {
        std::cout << "-";
      }
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "export") {
    const bool server_side = argc >= 4 && std::string(argv[3]) == "--server";

    ExportCsvRequest req;
    req.set_write_file(server_side);

    ExportCsvResponse resp;

    auto status = monitor_stub->ExportCsv(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (server_side) {
      std::cout << "rows=" << resp.rows() << " path=" << resp.path() << "\n";
      return 0;
    }

    if (argc < 4) {
      std::cout << resp.csv();
      return 0;
    }

    std::ofstream out(argv[3], std::ios::binary | std::ios::trunc);
    if (!out) {
      std::cerr << "cannot open " << argv[3] << "\n";
      return 1;
    }
    out << resp.csv();
    std::cout << "rows=" << resp.rows() << " path=" << argv[3] << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "publish") {
    if (argc < 5) return 1;

    PublishRequest req;
    req.set_topic(argv[3]);
    req.set_payload(argv[4]);

    PublishResponse resp;

    auto status = broker_stub->Publish(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deliveries=" << resp.deliveries() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
