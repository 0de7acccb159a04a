#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/catalog/metric_catalog.hpp"
#include "internal/state/selection.hpp"
#include "internal/util/errors.hpp"

namespace {

using telemetry::catalog::MetricCatalog;
using telemetry::state::ActiveSelection;
using telemetry::state::ChannelMap;

void TestNormalizeDropsEmptyAndDuplicates() {
  const auto ids = ActiveSelection::Normalize({"SensorMov", "", "SensorLux", "SensorMov"});
  assert((ids == std::vector<std::string>{"SensorMov", "SensorLux"}));
}

void TestActiveIdsFollowSelectionOrder() {
  const auto      catalog = MetricCatalog::BuiltIn();
  ActiveSelection selection;
  selection.Replace({"SensorLux", "SensorMov"}, catalog);

  assert((selection.ActiveIds() ==
          std::vector<std::string>{"SensorLux:Lux", "SensorMov:dist_m", "SensorMov:vel_m_s", "SensorMov:acc_m_s2"}));
  assert(selection.IsActive("SensorMov", "vel_m_s"));
  assert(!selection.IsActive("SensorGyro", "ax"));
}

void TestReplaceRejectsSensorWithoutMetrics() {
  const auto      catalog = MetricCatalog::BuiltIn();
  ActiveSelection selection;
  selection.Replace({"SensorMov"}, catalog);

  bool threw = false;
  try {
    selection.Replace({"SensorMov", "SensorUnknown"}, catalog);
  } catch (const telemetry::util::InvalidSelection&) {
    threw = true;
  }
  assert(threw);
  assert((selection.Sensors() == std::vector<std::string>{"SensorMov"}));
}

void TestUpdateChannelsRestrictsMetrics() {
  const auto      catalog = MetricCatalog::BuiltIn();
  ActiveSelection selection;
  selection.Replace({"SensorMov", "SensorLux"}, catalog);

  selection.UpdateChannels({{"SensorMov", {"acc_m_s2", "unknown"}}}, catalog);
  assert((selection.ActiveIds() == std::vector<std::string>{"SensorMov:acc_m_s2", "SensorLux:Lux"}));
  assert(selection.ChannelsFor("SensorMov")->size() == 1);
  assert(selection.ChannelsFor("SensorLux") == nullptr);
}

void TestInvalidChannelUpdateChangesNothing() {
  const auto      catalog = MetricCatalog::BuiltIn();
  ActiveSelection selection;
  selection.Replace({"SensorMov", "SensorLux"}, catalog);
  selection.UpdateChannels({{"SensorMov", {"dist_m"}}}, catalog);
  const ChannelMap before_channels = selection.Channels();
  const auto       before_ids      = selection.ActiveIds();

  bool threw = false;
  try {
    // The Mov entry alone would be valid; Lux would lose every channel.
    selection.UpdateChannels({{"SensorLux", {}}, {"SensorMov", {"vel_m_s"}}}, catalog);
  } catch (const telemetry::util::InvalidSelection&) {
    threw = true;
  }
  assert(threw);
  assert(selection.Channels() == before_channels);
  assert(selection.ActiveIds() == before_ids);

  threw = false;
  try {
    selection.UpdateChannels({{"SensorGyro", {"ax"}}}, catalog);
  } catch (const telemetry::util::InvalidSelection&) {
    threw = true;
  }
  assert(threw);
}

void TestReplaceKeepsChannelsOfRemainingSensors() {
  const auto      catalog = MetricCatalog::BuiltIn();
  ActiveSelection selection;
  selection.Replace({"SensorMov", "SensorLux"}, catalog);
  selection.UpdateChannels({{"SensorMov", {"dist_m"}}}, catalog);

  selection.Replace({"SensorMov"}, catalog);
  assert(selection.ChannelsFor("SensorMov") != nullptr);
  assert((selection.ActiveIds() == std::vector<std::string>{"SensorMov:dist_m"}));

  selection.Replace({"SensorLux"}, catalog);
  selection.Replace({"SensorMov"}, catalog);
  assert(selection.ChannelsFor("SensorMov") == nullptr);
  assert(selection.ActiveIds().size() == 3);
}

} // namespace

int main() {
  TestNormalizeDropsEmptyAndDuplicates();
  TestActiveIdsFollowSelectionOrder();
  TestReplaceRejectsSensorWithoutMetrics();
  TestUpdateChannelsRestrictsMetrics();
  TestInvalidChannelUpdateChangesNothing();
  TestReplaceKeepsChannelsOfRemainingSensors();

  std::cout << "telemetry_monitor_unit_selection: pass\n";
  return 0;
}
