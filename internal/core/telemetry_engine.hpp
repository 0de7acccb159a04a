#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/catalog/metric_catalog.hpp"
#include "internal/ingest/payload_fields.hpp"
#include "internal/state/last_value_cache.hpp"
#include "internal/state/selection.hpp"
#include "internal/state/session.hpp"
#include "internal/state/snapshot_store.hpp"
#include "internal/state/time_series.hpp"
#include "internal/transport/topic.hpp"
#include "internal/transport/transport.hpp"

namespace telemetry::core {

struct EngineOptions {
  transport::TopicLayout topics;
  double                 default_sample_period_s{0.25};
  std::size_t            buffer_capacity{250};
};

struct SelectionChange {
  std::vector<std::string> selected;
  std::vector<std::string> active_ids;
  // True when the sensor set changed and the live state was reset.
  bool                     reset{false};
  std::size_t              subscribed{0};
  std::size_t              unsubscribed{0};
  std::size_t              failures{0};
};

struct MetricView {
  std::string                     qualified_id;
  std::vector<state::SampleValue> values;
  std::optional<double>           last;
};

/*
  Everything a reader needs for one refresh, taken under a single lock.
*/
struct View {
  bool                        live{true};
  std::string                 series_name;
  std::vector<double>         times;
  std::optional<double>       last_time;
  std::vector<MetricView>     metrics;
  std::optional<std::int64_t> dropped_count;
  state::SessionStatus        session;
};

/*
  Telemetry state engine.

  Owns the selection, the live time series, the last-value cache, the
  measurement session and the saved series. All of it is guarded by one
  mutex; a second mutex serializes selection changes so that the diff of
  subscribed topics and the calls into the transport happen in order
  without holding the state lock.

  Lock order: subscription_mutex_ before mutex_.
*/
class TelemetryEngine {
 public:
  TelemetryEngine(std::shared_ptr<const telemetry::catalog::MetricCatalog> catalog, EngineOptions options);

  TelemetryEngine(const TelemetryEngine&)            = delete;
  TelemetryEngine& operator=(const TelemetryEngine&) = delete;

  // Transport used for data topic subscriptions; may be null.
  void AttachTransport(std::shared_ptr<transport::Transport> transport);

  // Selection
  SelectionChange          SetSensors(const std::vector<std::string>& sensor_ids);
  std::vector<std::string> SetChannels(const std::string& sensor_id, const std::set<std::string>& metric_ids);
  std::vector<std::string> SetChannelMap(const state::ChannelMap& channels);

  // Removes the given sensors from the selection. No-op when none of them
  // is selected.
  SelectionChange DropSensors(const std::vector<std::string>& sensor_ids);

  // Subscribes every current data topic again, e.g. after a reconnect.
  // Returns the number of successful subscriptions.
  std::size_t ResubscribeAll();

  // Ingestion. OnMessage never throws; malformed input is dropped.
  void OnMessage(const std::string& topic, const std::string& payload);
  bool OnSample(const std::string& sensor_id, const ingest::Fields& fields);

  // Session
  void                 Start();
  bool                 Stop();
  void                 ConfigureDuration(double value, state::DurationUnit unit);
  bool                 Tick();
  // Archives the live buffers; the returned snapshot is the one stored.
  std::shared_ptr<const state::SeriesSnapshot> Save();
  void                 ClearAll();
  state::SessionStatus Status() const;

  // Saved series and display
  bool                                                      SelectForDisplay(const std::optional<std::string>& name);
  std::vector<std::string>                                  SnapshotNames() const;
  std::vector<std::shared_ptr<const state::SeriesSnapshot>> Snapshots() const;

  View CurrentView() const;

  std::vector<std::string> SelectedSensors() const;
  std::vector<std::string> ActiveIds() const;
  state::ChannelMap        Channels() const;
  std::set<std::string>    SubscribedTopics() const;
  std::size_t              BufferedSamples() const;

  double SamplePeriodFor(const std::string& sensor_id) const;

  const telemetry::catalog::MetricCatalog& catalog() const {
    return *catalog_;
  }
  const transport::TopicLayout& topics() const {
    return options_.topics;
  }

 private:
  // Requires subscription_mutex_.
  SelectionChange ApplySensors(const std::vector<std::string>& sensor_ids);
  void            SyncSubscriptions(const std::set<std::string>& next, SelectionChange& change);

  // Requires mutex_.
  void ResetLiveLocked();
  void ReconcileLocked();

  std::shared_ptr<const telemetry::catalog::MetricCatalog> catalog_;
  EngineOptions                                 options_;

  mutable std::mutex                    subscription_mutex_;
  std::shared_ptr<transport::Transport> transport_;
  std::set<std::string>                 topics_;

  mutable std::mutex        mutex_;
  state::ActiveSelection    selection_;
  state::TimeSeries         series_;
  state::LastValueCache     last_values_;
  state::MeasurementSession session_;
  state::SnapshotStore      snapshots_;
};

} // namespace telemetry::core
