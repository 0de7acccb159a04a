#include "selection.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/catalog/metric_catalog.hpp"
#include "internal/util/errors.hpp"

namespace telemetry::state {

std::string QualifiedMetricId(std::string_view sensor_id, std::string_view metric_id) {
  std::string id;
  id.reserve(sensor_id.size() + metric_id.size() + 1);
  id.append(sensor_id);
  id.push_back(':');
  id.append(metric_id);
  return id;
}

std::vector<std::string> ActiveSelection::Normalize(const std::vector<std::string>& sensor_ids) {
  std::vector<std::string>        unique;
  std::unordered_set<std::string> seen;
  for (const auto& id : sensor_ids) {
    if (id.empty() || !seen.insert(id).second) {
      continue;
    }
    unique.push_back(id);
  }
  return unique;
}

void ActiveSelection::Replace(const std::vector<std::string>& sensor_ids, const catalog::MetricCatalog& catalog) {
  for (const auto& sensor_id : sensor_ids) {
    if (catalog.ProfileFor(sensor_id).metrics.empty()) {
      throw util::InvalidSelection("sensor '" + sensor_id + "' has no metrics in the catalog");
    }
  }

  sensors_ = sensor_ids;
  for (auto it = channels_.begin(); it != channels_.end();) {
    if (!IsSelected(it->first)) {
      it = channels_.erase(it);
    } else {
      ++it;
    }
  }
  Recompute(catalog);
}

void ActiveSelection::UpdateChannels(const ChannelMap& updates, const catalog::MetricCatalog& catalog) {
  ChannelMap next = channels_;

  for (const auto& [sensor_id, metric_ids] : updates) {
    if (!IsSelected(sensor_id)) {
      throw util::InvalidSelection("sensor '" + sensor_id + "' is not selected");
    }

    const auto&           profile = catalog.ProfileFor(sensor_id);
    std::set<std::string> known;
    for (const auto& metric_id : metric_ids) {
      if (profile.FindMetric(metric_id) != nullptr) {
        known.insert(metric_id);
      }
    }
    if (known.empty()) {
      throw util::InvalidSelection("at least one channel must stay active for sensor '" + sensor_id + "'");
    }
    next[sensor_id] = std::move(known);
  }

  channels_ = std::move(next);
  Recompute(catalog);
}

void ActiveSelection::Clear() {
  sensors_.clear();
  channels_.clear();
  active_ids_.clear();
}

bool ActiveSelection::IsSelected(const std::string& sensor_id) const {
  return std::find(sensors_.begin(), sensors_.end(), sensor_id) != sensors_.end();
}

const std::set<std::string>* ActiveSelection::ChannelsFor(const std::string& sensor_id) const {
  auto it = channels_.find(sensor_id);
  return it == channels_.end() ? nullptr : &it->second;
}

bool ActiveSelection::IsActive(const std::string& sensor_id, const std::string& metric_id) const {
  if (!IsSelected(sensor_id)) {
    return false;
  }
  const auto* channels = ChannelsFor(sensor_id);
  return channels == nullptr || channels->count(metric_id) != 0;
}

void ActiveSelection::Recompute(const catalog::MetricCatalog& catalog) {
  active_ids_.clear();
  for (const auto& sensor_id : sensors_) {
    const auto* channels = ChannelsFor(sensor_id);
    for (const auto& metric : catalog.ProfileFor(sensor_id).metrics) {
      if (channels == nullptr || channels->count(metric.id) != 0) {
        active_ids_.push_back(QualifiedMetricId(sensor_id, metric.id));
      }
    }
  }
}

} // namespace telemetry::state
