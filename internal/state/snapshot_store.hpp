#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "time_series.hpp"

namespace telemetry::state {

struct SeriesSnapshot {
  std::string                                               name;
  std::vector<double>                                       times;
  std::vector<std::string>                                  metric_ids;
  std::unordered_map<std::string, std::vector<SampleValue>> values;

  const std::vector<SampleValue>* ValuesFor(const std::string& metric_id) const;
};

/*
  Saved series plus the display pointer (live or one saved series).

  Snapshots are shared as pointers to const and never change after Append,
  so readers may keep them past the owner's lock.
*/
class SnapshotStore {
 public:
  // Names the snapshot "Series N" and stores it.
  std::shared_ptr<const SeriesSnapshot> Append(std::vector<double> times, std::vector<std::string> metric_ids,
                                               std::unordered_map<std::string, std::vector<SampleValue>> values);

  // First snapshot with that name; unknown names and nullopt select the
  // live view. Returns true when a snapshot is displayed afterwards.
  bool SelectForDisplay(const std::optional<std::string>& name);

  void ShowLive() {
    display_index_.reset();
  }

  void ClearAll();

  bool                                  live() const {
    return !display_index_.has_value();
  }
  std::shared_ptr<const SeriesSnapshot> Displayed() const;

  std::vector<std::string>                                  Names() const;
  const std::vector<std::shared_ptr<const SeriesSnapshot>>& Snapshots() const {
    return snapshots_;
  }
  std::size_t size() const {
    return snapshots_.size();
  }

 private:
  std::vector<std::shared_ptr<const SeriesSnapshot>> snapshots_;
  std::uint64_t                                      counter_{0};
  std::optional<std::size_t>                         display_index_;
};

} // namespace telemetry::state
