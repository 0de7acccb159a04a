#include "time_series.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace telemetry::state {

TimeSeries::TimeSeries(std::size_t capacity) : capacity_(capacity), times_(capacity) {
}

std::size_t TimeSeries::CapacityFor(double window_s, double sample_hz, std::size_t margin) {
  if (window_s <= 0.0 || sample_hz <= 0.0) {
    return margin;
  }
  return static_cast<std::size_t>(std::ceil(window_s * sample_hz)) + margin;
}

void TimeSeries::Reconcile(const std::vector<std::string>& metric_ids) {
  const std::unordered_set<std::string> wanted(metric_ids.begin(), metric_ids.end());

  for (auto it = values_.begin(); it != values_.end();) {
    if (wanted.count(it->first) == 0) {
      it = values_.erase(it);
    } else {
      ++it;
    }
  }

  for (const auto& id : metric_ids) {
    if (values_.count(id) != 0) {
      continue;
    }
    RingBuffer<SampleValue> buffer(capacity_);
    for (std::size_t i = 0; i < times_.size(); ++i) {
      buffer.Push(std::nullopt);
    }
    values_.emplace(id, std::move(buffer));
  }

  ids_.clear();
  for (const auto& id : metric_ids) {
    if (std::find(ids_.begin(), ids_.end(), id) == ids_.end()) {
      ids_.push_back(id);
    }
  }
}

void TimeSeries::Append(double t, const std::unordered_map<std::string, SampleValue>& row) {
  times_.Push(t);
  for (auto& [id, buffer] : values_) {
    auto it = row.find(id);
    buffer.Push(it == row.end() ? std::nullopt : it->second);
  }
}

void TimeSeries::Clear() {
  times_.Clear();
  for (auto& [id, buffer] : values_) {
    buffer.Clear();
  }
}

bool TimeSeries::empty() const {
  return times_.empty();
}

std::size_t TimeSeries::size() const {
  return times_.size();
}

bool TimeSeries::Has(const std::string& metric_id) const {
  return values_.count(metric_id) != 0;
}

std::vector<double> TimeSeries::Times() const {
  return times_.ToVector();
}

std::vector<SampleValue> TimeSeries::Values(const std::string& metric_id) const {
  auto it = values_.find(metric_id);
  if (it == values_.end()) {
    return {};
  }
  return it->second.ToVector();
}

} // namespace telemetry::state
