#include "topic.hpp"

#include <vector>

namespace telemetry::transport {

namespace {

std::vector<std::string_view> SplitLevels(std::string_view topic) {
  std::vector<std::string_view> levels;
  std::size_t                   start = 0;
  while (true) {
    const auto slash = topic.find('/', start);
    if (slash == std::string_view::npos) {
      levels.push_back(topic.substr(start));
      break;
    }
    levels.push_back(topic.substr(start, slash - start));
    start = slash + 1;
  }
  return levels;
}

} // namespace

std::string TopicLayout::DataTopic(std::string_view sensor_id) const {
  std::string topic;
  topic.reserve(prefix.size() + sensor_id.size() + data_suffix.size() + 2);
  topic.append(prefix).append("/").append(sensor_id).append("/").append(data_suffix);
  return topic;
}

std::string TopicLayout::DiscoveryFilter() const {
  return prefix + "/#";
}

std::optional<std::string> TopicLayout::SensorFromDataTopic(std::string_view topic) const {
  const auto levels = SplitLevels(topic);
  if (levels.size() != 3 || levels[0] != prefix || levels[2] != data_suffix || levels[1].empty()) {
    return std::nullopt;
  }
  return std::string(levels[1]);
}

bool TopicMatches(std::string_view filter, std::string_view topic) {
  const auto filter_levels = SplitLevels(filter);
  const auto topic_levels  = SplitLevels(topic);

  for (std::size_t i = 0; i < filter_levels.size(); ++i) {
    if (filter_levels[i] == "#") {
      return true;
    }
    if (i >= topic_levels.size()) {
      return false;
    }
    if (filter_levels[i] != "+" && filter_levels[i] != topic_levels[i]) {
      return false;
    }
  }
  return filter_levels.size() == topic_levels.size();
}

bool IsValidFilter(std::string_view filter) {
  if (filter.empty()) {
    return false;
  }

  const auto levels = SplitLevels(filter);
  for (std::size_t i = 0; i < levels.size(); ++i) {
    const auto level = levels[i];
    if (level.find('#') != std::string_view::npos && (level != "#" || i + 1 != levels.size())) {
      return false;
    }
    if (level.find('+') != std::string_view::npos && level != "+") {
      return false;
    }
  }
  return true;
}

} // namespace telemetry::transport
