#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace telemetry::catalog {
class MetricCatalog;
}

namespace telemetry::state {

using ChannelMap = std::map<std::string, std::set<std::string>>;

std::string QualifiedMetricId(std::string_view sensor_id, std::string_view metric_id);

/*
  Which sensors are selected and which of their metrics are active.

  A sensor without an entry in the channel map has all of its metrics
  active. Every selected sensor keeps at least one active metric; updates
  that would break this throw InvalidSelection and change nothing.
*/
class ActiveSelection {
 public:
  // Drops empty ids and duplicates, keeping first-seen order.
  static std::vector<std::string> Normalize(const std::vector<std::string>& sensor_ids);

  // Installs a new sensor list. Channel entries of sensors no longer
  // selected are dropped; entries of kept sensors stay.
  void Replace(const std::vector<std::string>& sensor_ids, const catalog::MetricCatalog& catalog);

  // Merges `updates` into the channel map after validating all of it.
  void UpdateChannels(const ChannelMap& updates, const catalog::MetricCatalog& catalog);

  void Clear();

  const std::vector<std::string>& Sensors() const {
    return sensors_;
  }
  const std::vector<std::string>& ActiveIds() const {
    return active_ids_;
  }
  const ChannelMap& Channels() const {
    return channels_;
  }

  bool IsSelected(const std::string& sensor_id) const;

  // nullptr when every metric of the sensor is active.
  const std::set<std::string>* ChannelsFor(const std::string& sensor_id) const;

  bool IsActive(const std::string& sensor_id, const std::string& metric_id) const;

 private:
  void Recompute(const catalog::MetricCatalog& catalog);

  std::vector<std::string> sensors_;
  ChannelMap               channels_;
  std::vector<std::string> active_ids_;
};

} // namespace telemetry::state
