#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace telemetry::state {

/*
  Most recent scaled value per qualified metric id, written on every
  accepted message whether or not a session is recording.
*/
struct LastValueCache {
  std::unordered_map<std::string, std::optional<double>> values;
  std::optional<double>                                  last_elapsed_s;
  std::optional<std::int64_t>                            dropped_count;

  std::optional<double> Get(const std::string& metric_id) const {
    auto it = values.find(metric_id);
    return it == values.end() ? std::nullopt : it->second;
  }

  // Keeps exactly the listed ids; new ids start absent.
  void Reconcile(const std::vector<std::string>& metric_ids) {
    std::unordered_map<std::string, std::optional<double>> kept;
    for (const auto& id : metric_ids) {
      kept[id] = Get(id);
    }
    values = std::move(kept);
  }

  // Forgets values and the last time label, keeps the key set.
  void ClearValues() {
    for (auto& [id, value] : values) {
      value.reset();
    }
    last_elapsed_s.reset();
  }

  void Clear() {
    ClearValues();
    dropped_count.reset();
  }
};

} // namespace telemetry::state
