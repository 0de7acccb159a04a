#include "metric_catalog.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "config/config.pb.h"

namespace telemetry::catalog {

namespace {

constexpr std::string_view kSensorPrefix = "Sensor";

MetricDef Metric(std::string id, std::string source_key, double scale, std::string label, std::string unit, std::string color,
                 bool default_enabled) {
  MetricDef metric;
  metric.id              = std::move(id);
  metric.source_key      = std::move(source_key);
  metric.scale           = scale;
  metric.hover_name      = label;
  metric.label           = std::move(label);
  metric.unit            = std::move(unit);
  metric.color           = std::move(color);
  metric.default_enabled = default_enabled;
  return metric;
}

SensorProfile MovementProfile() {
  SensorProfile profile;
  profile.type            = "Mov";
  profile.display_name    = "Motion sensor";
  profile.required_fields = {"t_ms", "cm", "v_cm_s", "a_cm_s2"};
  profile.metrics         = {
      Metric("dist_m", "cm", 0.01, "Distance", "m", "#1f77b4", true),
      Metric("vel_m_s", "v_cm_s", 0.01, "Velocity", "m/s", "#2ca02c", false),
      Metric("acc_m_s2", "a_cm_s2", 0.01, "Acceleration", "m/s²", "#ff0000", false),
  };
  return profile;
}

SensorProfile GyroProfile() {
  SensorProfile profile;
  profile.type            = "Gyro";
  profile.display_name    = "Gyroscope and accelerometer";
  profile.required_fields = {"t_ms", "temp_c", "ax", "ay", "az", "gx", "gy", "gz"};
  profile.metrics         = {
      Metric("temp_c", "temp_c", 1.0, "Temperature", "°C", "#ff7f0e", true),
      Metric("ax", "ax", 1.0, "Acceleration X", "m/s²", "#1f77b4", true),
      Metric("ay", "ay", 1.0, "Acceleration Y", "m/s²", "#2ca02c", false),
      Metric("az", "az", 1.0, "Acceleration Z", "m/s²", "#d62728", false),
      Metric("gx", "gx", 1.0, "Rotation X", "rad/s", "#9467bd", false),
      Metric("gy", "gy", 1.0, "Rotation Y", "rad/s", "#8c564b", false),
      Metric("gz", "gz", 1.0, "Rotation Z", "rad/s", "#e377c2", false),
  };
  return profile;
}

SensorProfile LuxProfile() {
  SensorProfile profile;
  profile.type            = "Lux";
  profile.display_name    = "Light sensor";
  profile.required_fields = {"t_ms", "Lux"};
  profile.metrics         = {Metric("Lux", "Lux", 1.0, "Lux", "lux", "#003300", true)};
  return profile;
}

SensorProfile DefaultFallback() {
  SensorProfile profile;
  profile.required_fields     = {"t_ms"};
  profile.dropped_count_field = "avg_dropped";
  return profile;
}

void Validate(const SensorProfile& profile) {
  if (profile.timestamp_field.empty()) {
    throw std::runtime_error("sensor type '" + profile.type + "' has an empty timestamp field");
  }

  std::unordered_set<std::string> ids;
  for (const auto& metric : profile.metrics) {
    if (metric.id.empty()) {
      throw std::runtime_error("sensor type '" + profile.type + "' has a metric without id");
    }
    if (metric.id.find(':') != std::string::npos) {
      throw std::runtime_error("metric id '" + metric.id + "' must not contain ':'");
    }
    if (!ids.insert(metric.id).second) {
      throw std::runtime_error("sensor type '" + profile.type + "' defines metric '" + metric.id + "' twice");
    }
  }

  if (profile.sample_period_s && *profile.sample_period_s <= 0.0) {
    throw std::runtime_error("sensor type '" + profile.type + "' has a non-positive sample period");
  }
}

} // namespace

const MetricDef* SensorProfile::FindMetric(std::string_view metric_id) const {
  auto it = std::find_if(metrics.begin(), metrics.end(), [&](const MetricDef& m) { return m.id == metric_id; });
  return it == metrics.end() ? nullptr : &*it;
}

std::vector<std::string> SensorProfile::MetricIds() const {
  std::vector<std::string> ids;
  ids.reserve(metrics.size());
  for (const auto& metric : metrics) {
    ids.push_back(metric.id);
  }
  return ids;
}

std::string SensorTypeOf(std::string_view sensor_id) {
  if (sensor_id.size() > kSensorPrefix.size() && sensor_id.substr(0, kSensorPrefix.size()) == kSensorPrefix) {
    return std::string(sensor_id.substr(kSensorPrefix.size()));
  }
  return std::string(sensor_id);
}

MetricCatalog::MetricCatalog(std::vector<SensorProfile> profiles, SensorProfile fallback) : fallback_(std::move(fallback)) {
  Validate(fallback_);
  for (auto& profile : profiles) {
    if (profile.type.empty()) {
      throw std::runtime_error("sensor type entry without type name");
    }
    Validate(profile);
    auto type = profile.type;
    if (!by_type_.emplace(type, std::move(profile)).second) {
      throw std::runtime_error("sensor type '" + type + "' is defined twice");
    }
  }
}

MetricCatalog MetricCatalog::BuiltIn() {
  return MetricCatalog({MovementProfile(), GyroProfile(), LuxProfile()}, DefaultFallback());
}

SensorProfile ProfileFromConfig(const telemetry::runtime::config::SensorTypeConfig& config) {
  SensorProfile profile;
  profile.type         = config.type();
  profile.display_name = config.display_name();
  profile.required_fields.assign(config.required_fields().begin(), config.required_fields().end());
  if (!config.timestamp_field().empty()) {
    profile.timestamp_field = config.timestamp_field();
  }
  if (!config.dropped_count_field().empty()) {
    profile.dropped_count_field = config.dropped_count_field();
  }
  if (config.has_sample_period_s()) {
    profile.sample_period_s = config.sample_period_s();
  }

  for (const auto& m : config.metrics()) {
    MetricDef metric;
    metric.id              = m.id();
    metric.source_key      = m.source_key().empty() ? m.id() : m.source_key();
    metric.scale           = m.has_scale() ? m.scale() : 1.0;
    metric.label           = m.label().empty() ? m.id() : m.label();
    metric.unit            = m.unit();
    metric.color           = m.color();
    metric.hover_name      = m.hover_name().empty() ? metric.label : m.hover_name();
    metric.default_enabled = m.has_default_enabled() ? m.default_enabled() : true;
    profile.metrics.push_back(std::move(metric));
  }
  return profile;
}

MetricCatalog MetricCatalog::FromConfig(const telemetry::runtime::config::RuntimeConfig& config) {
  SensorProfile fallback = DefaultFallback();
  const auto&   fallback_config = config.default_profile();
  if (fallback_config.required_fields_size() > 0 || fallback_config.metrics_size() > 0 || !fallback_config.dropped_count_field().empty()) {
    fallback = ProfileFromConfig(fallback_config);
  }

  if (config.sensor_types_size() == 0) {
    auto built_in = BuiltIn();
    std::vector<SensorProfile> profiles;
    for (const auto& [type, profile] : built_in.by_type_) {
      profiles.push_back(profile);
    }
    return MetricCatalog(std::move(profiles), std::move(fallback));
  }

  std::vector<SensorProfile> profiles;
  profiles.reserve(config.sensor_types_size());
  for (const auto& type_config : config.sensor_types()) {
    profiles.push_back(ProfileFromConfig(type_config));
  }
  return MetricCatalog(std::move(profiles), std::move(fallback));
}

const SensorProfile& MetricCatalog::ProfileFor(std::string_view sensor_id) const {
  auto it = by_type_.find(SensorTypeOf(sensor_id));
  if (it == by_type_.end()) {
    return fallback_;
  }
  return it->second;
}

bool MetricCatalog::HasType(std::string_view type) const {
  return by_type_.find(std::string(type)) != by_type_.end();
}

std::vector<std::string> MetricCatalog::Types() const {
  std::vector<std::string> types;
  types.reserve(by_type_.size());
  for (const auto& [type, profile] : by_type_) {
    types.push_back(type);
  }
  std::sort(types.begin(), types.end());
  return types;
}

} // namespace telemetry::catalog
