#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ring_buffer.hpp"

namespace telemetry::state {

using SampleValue = std::optional<double>;

/*
  Shared time axis plus one value buffer per qualified metric id.

  Every buffer has the same capacity and, at all times, the same length as
  the time buffer.
*/
class TimeSeries {
 public:
  explicit TimeSeries(std::size_t capacity);

  // ceil(window_s * sample_hz) + margin
  static std::size_t CapacityFor(double window_s, double sample_hz, std::size_t margin);

  // Creates missing buffers (padded with absent values to the current
  // length) and drops buffers whose id is no longer listed.
  void Reconcile(const std::vector<std::string>& metric_ids);

  // Appends one row. Ids without an entry in `row` receive an absent value.
  void Append(double t, const std::unordered_map<std::string, SampleValue>& row);

  void Clear();

  bool        empty() const;
  std::size_t size() const;
  std::size_t capacity() const {
    return capacity_;
  }

  bool                     Has(const std::string& metric_id) const;
  const std::vector<std::string>& Ids() const {
    return ids_;
  }

  std::vector<double>      Times() const;
  std::vector<SampleValue> Values(const std::string& metric_id) const;

 private:
  std::size_t                                              capacity_;
  RingBuffer<double>                                       times_;
  std::vector<std::string>                                 ids_;
  std::unordered_map<std::string, RingBuffer<SampleValue>> values_;
};

} // namespace telemetry::state
