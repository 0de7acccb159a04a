#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "payload_fields.hpp"

namespace telemetry::catalog {
struct SensorProfile;
}

namespace telemetry::ingest {

/*
  One validated, scaled message of one sensor.
*/
struct ComputedSample {
  std::string  sensor_id;
  std::int64_t timestamp{0};

  // Qualified metric id -> scaled value, in profile order. Only metrics in
  // the sensor's active channel set appear.
  std::vector<std::pair<std::string, std::optional<double>>> values;

  std::optional<std::int64_t> dropped_count;
};

/*
  Validates `fields` against `profile` and computes the scaled values of
  the active channels (`channels == nullptr` means all metrics).

  Returns nullopt when the message must be dropped: a required field is
  missing or the timestamp field is not an integer. A metric whose source
  field is missing or not numeric yields an absent value, never zero.
*/
std::optional<ComputedSample> ComputeSample(const std::string& sensor_id, const catalog::SensorProfile& profile, const Fields& fields,
                                            const std::set<std::string>* channels);

} // namespace telemetry::ingest
