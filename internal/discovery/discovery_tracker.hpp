#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/transport/topic.hpp"

namespace telemetry::discovery {

struct DiscoveryResult {
  std::vector<std::string> active;
  std::vector<std::string> evicted;
};

/*
  Sensors currently announcing themselves, keyed by id with the monotonic
  time they were last seen.

  Independent from the engine's state lock; the clock is always passed in.
*/
class DiscoveryTracker {
 public:
  explicit DiscoveryTracker(transport::TopicLayout topics = {});

  void OnAnnouncement(const std::string& sensor_id, double now_s);

  // Records the sensor of a data topic; other topics are ignored.
  // Returns true when the topic announced a sensor.
  bool OnTopic(std::string_view topic, double now_s);

  // Sorted ids seen within `stale_after_s`; older entries are evicted and
  // reported. stale_after_s <= 0 disables eviction.
  DiscoveryResult ActiveSensors(double now_s, double stale_after_s);

  // Every tracked sensor with its last-seen time, sorted by id. Does not
  // evict.
  std::vector<std::pair<std::string, double>> Entries() const;

  std::optional<double> LastSeen(const std::string& sensor_id) const;
  std::size_t           Size() const;

  const transport::TopicLayout& topics() const {
    return topics_;
  }

 private:
  transport::TopicLayout                  topics_;
  mutable std::mutex                      mutex_;
  std::unordered_map<std::string, double> last_seen_;
};

} // namespace telemetry::discovery
