#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "internal/export/csv_exporter.hpp"
#include "internal/state/snapshot_store.hpp"

namespace {

using telemetry::state::SampleValue;
using telemetry::state::SnapshotStore;

void TestQuoteField() {
  assert(telemetry::csv::QuoteField("plain") == "plain");
  assert(telemetry::csv::QuoteField("a,b") == "\"a,b\"");
  assert(telemetry::csv::QuoteField("say \"hi\"") == "\"say \"\"hi\"\"\"");
  assert(telemetry::csv::QuoteField("two\nlines") == "\"two\nlines\"");
  assert(telemetry::csv::QuoteField("") == "");
}

void TestUnionOfColumnsAndEmptyCells() {
  SnapshotStore store;
  store.Append({0.0, 0.25}, {"SensorMov:dist_m", "SensorLux:Lux"},
               {{"SensorMov:dist_m", {2.5, SampleValue{}}}, {"SensorLux:Lux", {SampleValue{}, 42.5}}});
  store.Append({0.0}, {"SensorLux:Lux", "SensorGyro:ax"}, {{"SensorLux:Lux", {0.75}}, {"SensorGyro:ax", {-1.5}}});

  const auto document = telemetry::csv::ExportSeries(store.Snapshots());
  assert(document.rows == 3);

  const std::string expected = "series,t_s,SensorMov:dist_m,SensorLux:Lux,SensorGyro:ax\r\n"
                               "Series 1,0.00,2.5,,\r\n"
                               "Series 1,0.25,,42.5,\r\n"
                               "Series 2,0.00,,0.75,-1.5\r\n";
  assert(document.text == expected);
}

void TestTimeFormattedToTwoDecimals() {
  SnapshotStore store;
  store.Append({1.0 / 3.0, 12.005}, {"A:x"}, {{"A:x", {0.5, 0.5}}});

  const auto document = telemetry::csv::ExportSeries(store.Snapshots());
  std::istringstream lines(document.text);
  std::string        line;
  std::getline(lines, line);
  std::getline(lines, line);
  assert(line.rfind("Series 1,0.33,", 0) == 0);
}

void TestNoSnapshotsGivesHeaderOnly() {
  const auto document = telemetry::csv::ExportSeries({});
  assert(document.rows == 0);
  assert(document.text == "series,t_s\r\n");
}

void TestWriteFile() {
  auto dir = std::filesystem::temp_directory_path() / "telemetry_monitor_csv_tests";
  std::filesystem::create_directories(dir);
  const auto path = (dir / "series.csv").string();

  telemetry::csv::WriteFile(path, "series,t_s\r\n");
  std::ifstream in(path, std::ios::binary);
  std::string   content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(content == "series,t_s\r\n");

  bool threw = false;
  try {
    telemetry::csv::WriteFile((dir / "missing" / "series.csv").string(), "x");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  std::filesystem::remove_all(dir);
}

} // namespace

int main() {
  TestQuoteField();
  TestUnionOfColumnsAndEmptyCells();
  TestTimeFormattedToTwoDecimals();
  TestNoSnapshotsGivesHeaderOnly();
  TestWriteFile();

  std::cout << "telemetry_monitor_unit_csv_exporter: pass\n";
  return 0;
}
