#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"
#include "internal/catalog/metric_catalog.hpp"
#include "internal/config/config_loader.hpp"

namespace {

using telemetry::catalog::MetricCatalog;
using telemetry::catalog::MetricDef;
using telemetry::catalog::SensorProfile;
using telemetry::catalog::SensorTypeOf;

void TestSensorTypeStripsPrefix() {
  assert(SensorTypeOf("SensorMov") == "Mov");
  assert(SensorTypeOf("SensorGyro") == "Gyro");
  assert(SensorTypeOf("Lux") == "Lux");
  assert(SensorTypeOf("Sensor") == "Sensor");
}

void TestBuiltInProfiles() {
  const auto catalog = MetricCatalog::BuiltIn();
  assert((catalog.Types() == std::vector<std::string>{"Gyro", "Lux", "Mov"}));

  const auto& mov = catalog.ProfileFor("SensorMov");
  assert(mov.type == "Mov");
  assert((mov.MetricIds() == std::vector<std::string>{"dist_m", "vel_m_s", "acc_m_s2"}));
  const auto* dist = mov.FindMetric("dist_m");
  assert(dist != nullptr);
  assert(dist->source_key == "cm");
  assert(dist->scale == 0.01);
  assert(dist->default_enabled);
  assert(!mov.FindMetric("vel_m_s")->default_enabled);

  const auto& gyro = catalog.ProfileFor("SensorGyro");
  assert(gyro.metrics.size() == 7);
  assert(gyro.required_fields.size() == 8);

  const auto& lux = catalog.ProfileFor("SensorLux");
  assert(lux.metrics.size() == 1);
  assert(lux.metrics[0].source_key == "Lux");
}

void TestUnknownTypeResolvesToFallback() {
  const auto  catalog = MetricCatalog::BuiltIn();
  const auto& profile = catalog.ProfileFor("SensorBaro");
  assert(&profile == &catalog.Fallback());
  assert(profile.metrics.empty());
  assert(profile.dropped_count_field.has_value());
  assert(*profile.dropped_count_field == "avg_dropped");
  assert(!catalog.HasType("Baro"));
}

void TestDuplicateTypeRejected() {
  SensorProfile a;
  a.type = "Mov";
  a.metrics.push_back(MetricDef{"x", "x"});
  SensorProfile b = a;

  bool threw = false;
  try {
    MetricCatalog catalog({a, b}, SensorProfile{});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestDuplicateMetricRejected() {
  SensorProfile profile;
  profile.type = "Dup";
  profile.metrics.push_back(MetricDef{"x", "x"});
  profile.metrics.push_back(MetricDef{"x", "y"});

  bool threw = false;
  try {
    MetricCatalog catalog({profile}, SensorProfile{});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMetricIdWithSeparatorRejected() {
  SensorProfile profile;
  profile.type = "Bad";
  profile.metrics.push_back(MetricDef{"a:b", "a"});

  bool threw = false;
  try {
    MetricCatalog catalog({profile}, SensorProfile{});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestFromConfigWithoutTypesUsesBuiltIns() {
  const auto config  = telemetry::config::ConfigLoader::LoadFromYamlString("");
  const auto catalog = MetricCatalog::FromConfig(config);
  assert(catalog.HasType("Mov"));
  assert(catalog.HasType("Gyro"));
  assert(catalog.HasType("Lux"));
}

void TestFromConfigReplacesBuiltIns() {
  const auto config = telemetry::config::ConfigLoader::LoadFromYamlString(R"(
sensor_types:
  - type: Baro
    display_name: Barometer
    required_fields: [t_ms, hpa]
    sample_period_s: 0.5
    metrics:
      - id: pressure_kpa
        source_key: hpa
        scale: 0.1
        unit: kPa
      - id: raw
        default_enabled: false
)");

  const auto catalog = MetricCatalog::FromConfig(config);
  assert(!catalog.HasType("Mov"));
  assert(catalog.HasType("Baro"));

  const auto& baro = catalog.ProfileFor("SensorBaro");
  assert(baro.display_name == "Barometer");
  assert(baro.timestamp_field == "t_ms");
  assert(baro.sample_period_s.has_value() && *baro.sample_period_s == 0.5);
  assert(baro.metrics.size() == 2);
  assert(baro.metrics[0].scale == 0.1);
  assert(baro.metrics[0].label == "pressure_kpa");
  assert(baro.metrics[1].source_key == "raw");
  assert(baro.metrics[1].scale == 1.0);
  assert(!baro.metrics[1].default_enabled);
}

} // namespace

int main() {
  TestSensorTypeStripsPrefix();
  TestBuiltInProfiles();
  TestUnknownTypeResolvesToFallback();
  TestDuplicateTypeRejected();
  TestDuplicateMetricRejected();
  TestMetricIdWithSeparatorRejected();
  TestFromConfigWithoutTypesUsesBuiltIns();
  TestFromConfigReplacesBuiltIns();

  std::cout << "telemetry_monitor_unit_metric_catalog: pass\n";
  return 0;
}
