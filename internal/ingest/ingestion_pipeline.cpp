#include "ingestion_pipeline.hpp"

#include "internal/catalog/metric_catalog.hpp"
#include "internal/state/selection.hpp"

namespace telemetry::ingest {

std::optional<ComputedSample> ComputeSample(const std::string& sensor_id, const catalog::SensorProfile& profile, const Fields& fields,
                                            const std::set<std::string>* channels) {
  auto timestamp = CoerceInteger(FindField(fields, profile.timestamp_field));
  if (!timestamp) {
    return std::nullopt;
  }

  for (const auto& required : profile.required_fields) {
    if (!HasField(fields, required)) {
      return std::nullopt;
    }
  }

  ComputedSample sample;
  sample.sensor_id = sensor_id;
  sample.timestamp = *timestamp;

  for (const auto& metric : profile.metrics) {
    if (channels != nullptr && channels->count(metric.id) == 0) {
      continue;
    }

    auto value = CoerceDouble(FindField(fields, metric.source_key));
    if (value) {
      *value *= metric.scale;
    }
    sample.values.emplace_back(state::QualifiedMetricId(sensor_id, metric.id), value);
  }

  if (profile.dropped_count_field) {
    sample.dropped_count = CoerceInteger(FindField(fields, *profile.dropped_count_field));
  }

  return sample;
}

} // namespace telemetry::ingest
