#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace telemetry::transport {

/*
  Topic convention: <prefix>/<sensor_id>/<data_suffix>.
*/
struct TopicLayout {
  std::string prefix{"EQ1"};
  std::string data_suffix{"data"};

  std::string DataTopic(std::string_view sensor_id) const;

  // <prefix>/#
  std::string DiscoveryFilter() const;

  // Sensor id of a data topic; nullopt for any other topic.
  std::optional<std::string> SensorFromDataTopic(std::string_view topic) const;
};

// MQTT-style filter match: '+' matches one level, a trailing '#' matches
// the remaining levels (including none).
bool TopicMatches(std::string_view filter, std::string_view topic);

bool IsValidFilter(std::string_view filter);

} // namespace telemetry::transport
