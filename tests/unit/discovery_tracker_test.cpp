#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/discovery/discovery_tracker.hpp"

namespace {

using telemetry::discovery::DiscoveryTracker;
using telemetry::transport::TopicLayout;

void TestOnTopicRecordsDataTopicsOnly() {
  DiscoveryTracker tracker;
  assert(tracker.OnTopic("EQ1/SensorMov/data", 1.0));
  assert(!tracker.OnTopic("EQ1/SensorMov/status", 1.0));
  assert(!tracker.OnTopic("EQ2/SensorLux/data", 1.0));
  assert(!tracker.OnTopic("EQ1/SensorLux/data/extra", 1.0));
  assert(!tracker.OnTopic("EQ1//data", 1.0));

  assert(tracker.Size() == 1);
  assert(tracker.LastSeen("SensorMov") == 1.0);
  assert(!tracker.LastSeen("SensorLux").has_value());
}

void TestCustomLayout() {
  TopicLayout layout;
  layout.prefix      = "LAB";
  layout.data_suffix = "telemetry";
  DiscoveryTracker tracker(layout);

  assert(tracker.OnTopic("LAB/SensorGyro/telemetry", 0.0));
  assert(!tracker.OnTopic("EQ1/SensorGyro/data", 0.0));
  assert(tracker.topics().DiscoveryFilter() == "LAB/#");
}

void TestAnnouncementRefreshesLastSeen() {
  DiscoveryTracker tracker;
  tracker.OnAnnouncement("SensorMov", 1.0);
  tracker.OnAnnouncement("SensorMov", 4.0);
  tracker.OnAnnouncement("", 4.0);
  assert(tracker.Size() == 1);
  assert(tracker.LastSeen("SensorMov") == 4.0);
}

void TestActiveSensorsEvictsStaleEntries() {
  DiscoveryTracker tracker;
  tracker.OnAnnouncement("SensorMov", 10.0);
  tracker.OnAnnouncement("SensorLux", 3.0);
  tracker.OnAnnouncement("SensorGyro", 9.0);

  const auto result = tracker.ActiveSensors(10.0, 5.0);
  assert((result.active == std::vector<std::string>{"SensorGyro", "SensorMov"}));
  assert((result.evicted == std::vector<std::string>{"SensorLux"}));
  assert(tracker.Size() == 2);

  // Exactly at the threshold is still fresh.
  const auto edge = tracker.ActiveSensors(14.0, 5.0);
  assert(edge.active.size() == 2);
  assert(edge.evicted.empty());
}

void TestNonPositiveStaleDisablesEviction() {
  DiscoveryTracker tracker;
  tracker.OnAnnouncement("SensorMov", 0.0);
  const auto result = tracker.ActiveSensors(1000.0, 0.0);
  assert(result.active.size() == 1);
  assert(result.evicted.empty());
}

void TestEntriesAreSortedAndDoNotEvict() {
  DiscoveryTracker tracker;
  tracker.OnAnnouncement("SensorMov", 1.0);
  tracker.OnAnnouncement("SensorGyro", 2.0);

  const auto entries = tracker.Entries();
  assert(entries.size() == 2);
  assert(entries[0].first == "SensorGyro" && entries[0].second == 2.0);
  assert(entries[1].first == "SensorMov");
  assert(tracker.Size() == 2);
}

} // namespace

int main() {
  TestOnTopicRecordsDataTopicsOnly();
  TestCustomLayout();
  TestAnnouncementRefreshesLastSeen();
  TestActiveSensorsEvictsStaleEntries();
  TestNonPositiveStaleDisablesEviction();
  TestEntriesAreSortedAndDoNotEvict();

  std::cout << "telemetry_monitor_unit_discovery_tracker: pass\n";
  return 0;
}
