#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "telemetry/monitor/v1.hpp"

namespace {

void Set(google::protobuf::Struct& fields, const std::string& key, double value) {
  (*fields.mutable_fields())[key].set_number_value(value);
}

// One payload shaped like the firmware of the given sensor type.
std::string MakePayload(const std::string& sensor_id, std::int64_t t_ms) {
  const double phase = static_cast<double>(t_ms) / 1000.0;

  google::protobuf::Struct fields;
  Set(fields, "t_ms", static_cast<double>(t_ms));

  if (sensor_id == "SensorMov") {
    Set(fields, "cm", 150.0 + 100.0 * std::sin(phase));
    Set(fields, "v_cm_s", 100.0 * std::cos(phase));
    Set(fields, "a_cm_s2", -100.0 * std::sin(phase));
  } else if (sensor_id == "SensorGyro") {
    Set(fields, "temp_c", 21.5);
    Set(fields, "ax", 0.1 * std::sin(phase));
    Set(fields, "ay", 0.1 * std::cos(phase));
    Set(fields, "az", 9.81);
    Set(fields, "gx", 0.01);
    Set(fields, "gy", 0.0);
    Set(fields, "gz", -0.01);
  } else if (sensor_id == "SensorLux") {
    Set(fields, "Lux", 300.0 + 50.0 * std::sin(phase / 4.0));
  } else {
    Set(fields, "avg_dropped", 0.0);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(fields, &json);
  if (!status.ok()) {
    return "{}";
  }
  return json;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage: sensor_simulator <addr> <sensor_id...> [--count N] [--hz F] [--prefix P]\n";
    return 1;
  }

  const std::string        target = argv[1];
  std::vector<std::string> sensors;
  int                      count  = 40;
  double                   hz     = 4.0;
  std::string              prefix = "EQ1";

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--count" && i + 1 < argc) {
      count = std::stoi(argv[++i]);
    } else if (arg == "--hz" && i + 1 < argc) {
      hz = std::stod(argv[++i]);
    } else if (arg == "--prefix" && i + 1 < argc) {
      prefix = argv[++i];
    } else {
      sensors.push_back(arg);
    }
  }
  if (sensors.empty() || !(hz > 0.0)) {
    std::cerr << "need at least one sensor and a positive rate\n";
    return 1;
  }

  auto stub = telemetry::monitor::v1::TelemetryBrokerService::NewStub(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  grpc::ClientContext                     ctx;
  telemetry::monitor::v1::PublishResponse resp;
  auto                                    writer = stub->PublishStream(&ctx, &resp);

  const auto period = std::chrono::duration<double>(1.0 / hz);
  auto       next   = std::chrono::steady_clock::now();
  for (int n = 0; n < count; ++n) {
    const auto t_ms = static_cast<std::int64_t>(std::llround(n * 1000.0 / hz));
    for (const auto& sensor_id : sensors) {
      telemetry::monitor::v1::PublishRequest req;
      req.set_topic(prefix + "/" + sensor_id + "/data");
      req.set_payload(MakePayload(sensor_id, t_ms));
      if (!writer->Write(req)) {
        std::cerr << "stream closed by server\n";
        n = count;
        break;
      }
    }
    next += std::chrono::duration_cast<std::chrono::steady_clock::duration>(period);
    std::this_thread::sleep_until(next);
  }

  writer->WritesDone();
  auto status = writer->Finish();
  if (!status.ok()) {
    std::cerr << "PublishStream failed: " << status.error_message() << '\n';
    return 2;
  }

  std::cout << "messages=" << resp.messages() << " deliveries=" << resp.deliveries() << '\n';
  return 0;
}
