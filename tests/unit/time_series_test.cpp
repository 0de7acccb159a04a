#include <cassert>
#include <iostream>
#include <string>
#include <unordered_map>

#include "internal/state/ring_buffer.hpp"
#include "internal/state/time_series.hpp"

namespace {

using telemetry::state::RingBuffer;
using telemetry::state::SampleValue;
using telemetry::state::TimeSeries;

void TestRingBufferKeepsLastCapacityEntries() {
  RingBuffer<int> buffer(4);
  for (int i = 0; i < 11; ++i) {
    buffer.Push(i);
  }

  assert(buffer.size() == 4);
  const auto items = buffer.ToVector();
  assert((items == std::vector<int>{7, 8, 9, 10}));
  assert(buffer.back() == 10);
  assert(buffer[0] == 7);
}

void TestZeroCapacityRingBufferStaysEmpty() {
  RingBuffer<int> buffer(0);
  buffer.Push(1);
  assert(buffer.empty());
}

void TestCapacityForDefaults() {
  assert(TimeSeries::CapacityFor(60.0, 4.0, 10) == 250);
  assert(TimeSeries::CapacityFor(10.0, 3.0, 0) == 30);
  assert(TimeSeries::CapacityFor(1.1, 3.0, 2) == 6);
}

void TestAppendFillsMissingIdsWithAbsentValues() {
  TimeSeries series(8);
  series.Reconcile({"A:x", "B:y"});

  series.Append(0.0, {{"A:x", 1.0}});
  series.Append(0.25, {{"A:x", 2.0}, {"B:y", 5.0}});

  assert(series.size() == 2);
  const auto b = series.Values("B:y");
  assert(b.size() == 2);
  assert(!b[0].has_value());
  assert(b[1] == 5.0);
}

void TestReconcileBackfillsNewIdsToCurrentLength() {
  TimeSeries series(8);
  series.Reconcile({"A:x"});
  series.Append(0.0, {{"A:x", 1.0}});
  series.Append(0.25, {{"A:x", 2.0}});

  series.Reconcile({"A:x", "A:y"});
  assert(series.Has("A:y"));
  const auto y = series.Values("A:y");
  assert(y.size() == series.size());
  assert(!y[0].has_value() && !y[1].has_value());

  series.Append(0.5, {{"A:x", 3.0}, {"A:y", 9.0}});
  assert(series.Values("A:x").size() == series.Times().size());
  assert(series.Values("A:y").size() == series.Times().size());
}

void TestReconcileDropsRemovedIdsAndKeepsOrder() {
  TimeSeries series(4);
  series.Reconcile({"B:y", "A:x"});
  series.Reconcile({"A:x"});

  assert(!series.Has("B:y"));
  assert((series.Ids() == std::vector<std::string>{"A:x"}));
  assert(series.Values("B:y").empty());
}

void TestOverflowKeepsBuffersAligned() {
  TimeSeries series(3);
  series.Reconcile({"A:x", "B:y"});
  for (int i = 0; i < 10; ++i) {
    std::unordered_map<std::string, SampleValue> row{{"A:x", static_cast<double>(i)}};
    if (i % 2 == 0) {
      row["B:y"] = static_cast<double>(i * 10);
    }
    series.Append(i * 0.25, row);
    assert(series.Values("A:x").size() == series.size());
    assert(series.Values("B:y").size() == series.size());
  }

  assert(series.size() == 3);
  assert((series.Times() == std::vector<double>{1.75, 2.0, 2.25}));
  const auto x = series.Values("A:x");
  assert(x[0] == 7.0 && x[1] == 8.0 && x[2] == 9.0);
}

void TestClearEmptiesEveryBuffer() {
  TimeSeries series(3);
  series.Reconcile({"A:x"});
  series.Append(0.0, {{"A:x", 1.0}});
  series.Clear();

  assert(series.empty());
  assert(series.Values("A:x").empty());
  assert(series.Has("A:x"));
}

} // namespace

int main() {
  TestRingBufferKeepsLastCapacityEntries();
  TestZeroCapacityRingBufferStaysEmpty();
  TestCapacityForDefaults();
  TestAppendFillsMissingIdsWithAbsentValues();
  TestReconcileBackfillsNewIdsToCurrentLength();
  TestReconcileDropsRemovedIdsAndKeepsOrder();
  TestOverflowKeepsBuffersAligned();
  TestClearEmptiesEveryBuffer();

  std::cout << "telemetry_monitor_unit_time_series: pass\n";
  return 0;
}
