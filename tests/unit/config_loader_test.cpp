#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using telemetry::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "telemetry_monitor_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestEmptyDocumentUsesDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.broker().host() == "localhost");
  assert(config.broker().port() == 1883);
  assert(config.broker().queue_capacity() == 1024);
  assert(config.topics().prefix() == "EQ1");
  assert(config.topics().data_suffix() == "data");
  assert(config.discovery().stale_after_s() == 5.0);
  assert(config.discovery().drop_stale_selected());
  assert(config.recording().sample_hz() == 4.0);
  assert(config.recording().window_s() == 60.0);
  assert(config.recording().margin_samples() == 10);
  assert(config.recording().refresh_ms() == 250);
  assert(config.exports().csv_path() == "series_export.csv");
  assert(config.logging().level() == "info");
}

void TestFileValuesOverrideDefaults() {
  const auto yaml_path = WriteYaml("overrides",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
broker:
  host: broker.local
  port: 8883
  accounts:
    - username: measure
      password: "1234"
    - username: supervisor
      password: pw
      allowed_filters: ["EQ1/#"]
  measurement:
    username: measure
    password: "1234"
topics:
  prefix: LAB
discovery:
  stale_after_s: 2.5
  drop_stale_selected: false
recording:
  sample_hz: 10
exports:
  csv_path: /tmp/out.csv
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.broker().host() == "broker.local");
  assert(config.broker().port() == 8883);
  assert(config.broker().accounts_size() == 2);
  assert(config.broker().accounts(1).allowed_filters(0) == "EQ1/#");
  assert(config.broker().measurement().username() == "measure");
  assert(config.topics().prefix() == "LAB");
  assert(config.topics().data_suffix() == "data");
  assert(config.discovery().stale_after_s() == 2.5);
  assert(!config.discovery().drop_stale_selected());
  assert(config.recording().sample_hz() == 10.0);
  assert(config.recording().window_s() == 60.0);
  assert(config.exports().csv_path() == "/tmp/out.csv");
}

void TestQuotedNumbersStayStrings() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(broker:
  measurement:
    username: "007"
    password: "1234"
)");
  assert(config.broker().measurement().username() == "007");
  assert(config.broker().measurement().password() == "1234");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(sensor_types:
  - type: Temp
    display_name: "line1\nline2☃"
    metrics:
      - id: c
        unit: "°C"
)");
  assert(config.sensor_types(0).display_name() == std::string("line1\nline2☃"));
  assert(config.sensor_types(0).metrics(0).unit() == "°C");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestInvalidValuesAreRejected() {
  assert(Rejects("- just\n- a list\n"));
  assert(Rejects("broker:\n  port: 70000\n"));
  assert(Rejects("recording:\n  sample_hz: -1\n"));
  assert(Rejects("topics:\n  prefix: \"EQ1/#\"\n"));
  assert(Rejects("broker:\n  accounts:\n    - password: pw\n"));
  assert(Rejects("server: [\n"));
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/telemetry-monitor.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyDocumentUsesDefaults();
  TestFileValuesOverrideDefaults();
  TestQuotedNumbersStayStrings();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestMissingFileIsRejected();

  std::cout << "telemetry_monitor_unit_config_loader: pass\n";
  return 0;
}
