#include "snapshot_store.hpp"

#include <utility>

namespace telemetry::state {

const std::vector<SampleValue>* SeriesSnapshot::ValuesFor(const std::string& metric_id) const {
  auto it = values.find(metric_id);
  return it == values.end() ? nullptr : &it->second;
}

std::shared_ptr<const SeriesSnapshot> SnapshotStore::Append(std::vector<double> times, std::vector<std::string> metric_ids,
                                                            std::unordered_map<std::string, std::vector<SampleValue>> values) {
  auto snapshot        = std::make_shared<SeriesSnapshot>();
  snapshot->name       = "Series " + std::to_string(++counter_);
  snapshot->times      = std::move(times);
  snapshot->metric_ids = std::move(metric_ids);
  snapshot->values     = std::move(values);

  snapshots_.push_back(snapshot);
  return snapshot;
}

bool SnapshotStore::SelectForDisplay(const std::optional<std::string>& name) {
  display_index_.reset();
  if (!name || name->empty()) {
    return false;
  }

  for (std::size_t i = 0; i < snapshots_.size(); ++i) {
    if (snapshots_[i]->name == *name) {
      display_index_ = i;
      return true;
    }
  }
  return false;
}

void SnapshotStore::ClearAll() {
  snapshots_.clear();
  counter_ = 0;
  display_index_.reset();
}

std::shared_ptr<const SeriesSnapshot> SnapshotStore::Displayed() const {
  if (!display_index_ || *display_index_ >= snapshots_.size()) {
    return nullptr;
  }
  return snapshots_[*display_index_];
}

std::vector<std::string> SnapshotStore::Names() const {
  std::vector<std::string> names;
  names.reserve(snapshots_.size());
  for (const auto& snapshot : snapshots_) {
    names.push_back(snapshot->name);
  }
  return names;
}

} // namespace telemetry::state
