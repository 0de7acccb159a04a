#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace telemetry::runtime::config {
class RuntimeConfig;
class SensorTypeConfig;
}

namespace telemetry::catalog {

struct MetricDef {
  std::string id;
  std::string source_key;
  double      scale{1.0};

  // Display metadata, opaque to the engine.
  std::string label;
  std::string unit;
  std::string color;
  std::string hover_name;

  bool default_enabled{true};
};

struct SensorProfile {
  std::string                type;
  std::string                display_name;
  std::vector<std::string>   required_fields;
  std::string                timestamp_field{"t_ms"};
  std::vector<MetricDef>     metrics;
  std::optional<std::string> dropped_count_field;
  std::optional<double>      sample_period_s;

  const MetricDef*         FindMetric(std::string_view metric_id) const;
  std::vector<std::string> MetricIds() const;
};

/*
  Maps a sensor id to its type key.

  "SensorMov" -> "Mov". Ids without the "Sensor" prefix are their own type.
*/
std::string SensorTypeOf(std::string_view sensor_id);

/*
  Read-only lookup from sensor type to profile.

  Unknown types resolve to the fallback profile so ingestion never fails
  hard on an unrecognized sensor.
*/
class MetricCatalog {
 public:
  MetricCatalog(std::vector<SensorProfile> profiles, SensorProfile fallback);

  static MetricCatalog BuiltIn();
  static MetricCatalog FromConfig(const telemetry::runtime::config::RuntimeConfig& config);

  const SensorProfile& ProfileFor(std::string_view sensor_id) const;
  const SensorProfile& Fallback() const {
    return fallback_;
  }

  bool                     HasType(std::string_view type) const;
  std::vector<std::string> Types() const;

 private:
  std::unordered_map<std::string, SensorProfile> by_type_;
  SensorProfile                                  fallback_;
};

SensorProfile ProfileFromConfig(const telemetry::runtime::config::SensorTypeConfig& config);

} // namespace telemetry::catalog
