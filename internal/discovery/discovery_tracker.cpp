#include "discovery_tracker.hpp"

#include <algorithm>
#include <utility>

namespace telemetry::discovery {

DiscoveryTracker::DiscoveryTracker(transport::TopicLayout topics) : topics_(std::move(topics)) {
}

void DiscoveryTracker::OnAnnouncement(const std::string& sensor_id, double now_s) {
  if (sensor_id.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  last_seen_[sensor_id] = now_s;
}

bool DiscoveryTracker::OnTopic(std::string_view topic, double now_s) {
  auto sensor_id = topics_.SensorFromDataTopic(topic);
  if (!sensor_id) {
    return false;
  }
  OnAnnouncement(*sensor_id, now_s);
  return true;
}

DiscoveryResult DiscoveryTracker::ActiveSensors(double now_s, double stale_after_s) {
  DiscoveryResult result;

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = last_seen_.begin(); it != last_seen_.end();) {
    if (stale_after_s > 0.0 && now_s - it->second > stale_after_s) {
      result.evicted.push_back(it->first);
      it = last_seen_.erase(it);
      continue;
    }
    result.active.push_back(it->first);
    ++it;
  }

  std::sort(result.active.begin(), result.active.end());
  std::sort(result.evicted.begin(), result.evicted.end());
  return result;
}

std::vector<std::pair<std::string, double>> DiscoveryTracker::Entries() const {
  std::vector<std::pair<std::string, double>> entries;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries.assign(last_seen_.begin(), last_seen_.end());
  }
  std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
  return entries;
}

std::optional<double> DiscoveryTracker::LastSeen(const std::string& sensor_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = last_seen_.find(sensor_id);
  if (it == last_seen_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t DiscoveryTracker::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_seen_.size();
}

} // namespace telemetry::discovery
