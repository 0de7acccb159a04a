#include "telemetry_engine.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "internal/ingest/ingestion_pipeline.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace telemetry::core {

using telemetry::observability::DoubleField;
using telemetry::observability::IntField;
using telemetry::observability::StringField;

namespace {

bool SameSet(const std::vector<std::string>& a, const std::vector<std::string>& b) {
  return std::set<std::string>(a.begin(), a.end()) == std::set<std::string>(b.begin(), b.end());
}

} // namespace

TelemetryEngine::TelemetryEngine(std::shared_ptr<const telemetry::catalog::MetricCatalog> catalog, EngineOptions options)
    : catalog_(std::move(catalog)), options_(std::move(options)), series_(options_.buffer_capacity) {
  if (!catalog_) {
    throw std::invalid_argument("TelemetryEngine requires a metric catalog");
  }
  if (!(options_.default_sample_period_s > 0.0)) {
    throw std::invalid_argument("TelemetryEngine requires a positive default sample period");
  }
}

void TelemetryEngine::AttachTransport(std::shared_ptr<transport::Transport> transport) {
  std::lock_guard<std::mutex> lock(subscription_mutex_);
  transport_ = std::move(transport);
}

SelectionChange TelemetryEngine::SetSensors(const std::vector<std::string>& sensor_ids) {
  std::lock_guard<std::mutex> lock(subscription_mutex_);
  return ApplySensors(state::ActiveSelection::Normalize(sensor_ids));
}

SelectionChange TelemetryEngine::DropSensors(const std::vector<std::string>& sensor_ids) {
  std::lock_guard<std::mutex> lock(subscription_mutex_);

  std::vector<std::string> remaining;
  {
    std::lock_guard<std::mutex> state_lock(mutex_);
    const std::set<std::string> dropped(sensor_ids.begin(), sensor_ids.end());
    for (const auto& sensor_id : selection_.Sensors()) {
      if (dropped.count(sensor_id) == 0) {
        remaining.push_back(sensor_id);
      }
    }
    if (remaining.size() == selection_.Sensors().size()) {
      SelectionChange unchanged;
      unchanged.selected   = selection_.Sensors();
      unchanged.active_ids = selection_.ActiveIds();
      return unchanged;
    }
  }

  TELEMETRY_LOG_INFO("Dropping stale sensors from selection", {IntField("remaining", static_cast<std::int64_t>(remaining.size()))});
  return ApplySensors(remaining);
}

SelectionChange TelemetryEngine::ApplySensors(const std::vector<std::string>& sensor_ids) {
  SelectionChange change;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool                  set_changed = !SameSet(sensor_ids, selection_.Sensors());

    // Throws before touching anything when a sensor has no metrics.
    selection_.Replace(sensor_ids, *catalog_);

    if (set_changed) {
      ResetLiveLocked();
    }
    ReconcileLocked();

    change.selected   = selection_.Sensors();
    change.active_ids = selection_.ActiveIds();
    change.reset      = set_changed;
  }

  std::set<std::string> next;
  for (const auto& sensor_id : change.selected) {
    next.insert(options_.topics.DataTopic(sensor_id));
  }
  SyncSubscriptions(next, change);

  TELEMETRY_LOG_INFO("Sensor selection updated", {IntField("sensors", static_cast<std::int64_t>(change.selected.size())),
                                                  IntField("active_metrics", static_cast<std::int64_t>(change.active_ids.size())),
                                                  IntField("subscribed", static_cast<std::int64_t>(change.subscribed)),
                                                  IntField("unsubscribed", static_cast<std::int64_t>(change.unsubscribed)),
                                                  IntField("failures", static_cast<std::int64_t>(change.failures))});
  return change;
}

void TelemetryEngine::SyncSubscriptions(const std::set<std::string>& next, SelectionChange& change) {
  std::vector<std::string> removed;
  std::vector<std::string> added;
  std::set_difference(topics_.begin(), topics_.end(), next.begin(), next.end(), std::back_inserter(removed));
  std::set_difference(next.begin(), next.end(), topics_.begin(), topics_.end(), std::back_inserter(added));

  // Optimistic: the topic set follows the selection even when the
  // transport rejects a call. ResubscribeAll repairs it on reconnect.
  topics_ = next;

  if (!transport_) {
    return;
  }

  for (const auto& topic : removed) {
    try {
      transport_->Unsubscribe(topic);
      ++change.unsubscribed;
    } catch (const util::SubscriptionError& e) {
      ++change.failures;
      observability::Metrics::Instance().RecordSubscriptionFailure("unsubscribe");
      TELEMETRY_LOG_WARN("Unsubscribe failed", {StringField("topic", topic), StringField("error", e.what())});
    }
  }

  for (const auto& topic : added) {
    try {
      transport_->Subscribe(topic);
      ++change.subscribed;
    } catch (const util::SubscriptionError& e) {
      ++change.failures;
      observability::Metrics::Instance().RecordSubscriptionFailure("subscribe");
      TELEMETRY_LOG_WARN("Subscribe failed", {StringField("topic", topic), StringField("error", e.what())});
    }
  }
}

std::size_t TelemetryEngine::ResubscribeAll() {
  std::lock_guard<std::mutex> lock(subscription_mutex_);
  if (!transport_) {
    return 0;
  }

  std::size_t subscribed = 0;
  for (const auto& topic : topics_) {
    try {
      transport_->Subscribe(topic);
      ++subscribed;
    } catch (const util::SubscriptionError& e) {
      observability::Metrics::Instance().RecordSubscriptionFailure("resubscribe");
      TELEMETRY_LOG_WARN("Resubscribe failed", {StringField("topic", topic), StringField("error", e.what())});
    }
  }

  TELEMETRY_LOG_INFO("Resubscribed data topics", {IntField("topics", static_cast<std::int64_t>(topics_.size())),
                                                  IntField("subscribed", static_cast<std::int64_t>(subscribed))});
  return subscribed;
}

std::vector<std::string> TelemetryEngine::SetChannels(const std::string& sensor_id, const std::set<std::string>& metric_ids) {
  return SetChannelMap({{sensor_id, metric_ids}});
}

std::vector<std::string> TelemetryEngine::SetChannelMap(const state::ChannelMap& channels) {
  std::lock_guard<std::mutex> sub_lock(subscription_mutex_);
  std::lock_guard<std::mutex> lock(mutex_);

  selection_.UpdateChannels(channels, *catalog_);
  ReconcileLocked();

  TELEMETRY_LOG_INFO("Channel selection updated", {IntField("sensors", static_cast<std::int64_t>(channels.size())),
                                                   IntField("active_metrics", static_cast<std::int64_t>(selection_.ActiveIds().size()))});
  return selection_.ActiveIds();
}

void TelemetryEngine::OnMessage(const std::string& topic, const std::string& payload) {
  try {
    auto sensor_id = options_.topics.SensorFromDataTopic(topic);
    if (!sensor_id) {
      return;
    }

    auto fields = ingest::ParsePayload(payload);
    if (!fields) {
      observability::Metrics::Instance().RecordSample(telemetry::catalog::SensorTypeOf(*sensor_id), false);
      TELEMETRY_LOG_DEBUG("Dropping payload that is not a JSON object", {StringField("topic", topic)});
      return;
    }

    OnSample(*sensor_id, *fields);
  } catch (const std::exception& e) {
    TELEMETRY_LOG_ERROR("Message processing failed", {StringField("topic", topic), StringField("error", e.what())});
  }
}

bool TelemetryEngine::OnSample(const std::string& sensor_id, const ingest::Fields& fields) {
  const auto& profile = catalog_->ProfileFor(sensor_id);
  bool        accepted = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!selection_.IsSelected(sensor_id)) {
      return false;
    }

    auto sample = ingest::ComputeSample(sensor_id, profile, fields, selection_.ChannelsFor(sensor_id));
    if (sample) {
      accepted = true;
      for (const auto& [metric_id, value] : sample->values) {
        last_values_.values[metric_id] = value;
      }
      last_values_.dropped_count = sample->dropped_count;

      if (session_.running()) {
        const double t              = session_.Advance(profile.sample_period_s.value_or(options_.default_sample_period_s));
        last_values_.last_elapsed_s = t;

        // Sensors that did not publish on this tick carry their last value.
        std::unordered_map<std::string, state::SampleValue> row;
        for (const auto& metric_id : selection_.ActiveIds()) {
          row.emplace(metric_id, last_values_.Get(metric_id));
        }
        series_.Append(t, row);
      }
    }
  }

  observability::Metrics::Instance().RecordSample(profile.type.empty() ? telemetry::catalog::SensorTypeOf(sensor_id) : profile.type, accepted);
  if (!accepted) {
    TELEMETRY_LOG_DEBUG("Dropping sample with missing or invalid fields", {StringField("sensor_id", sensor_id)});
  }
  return accepted;
}

void TelemetryEngine::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  session_.Start();
  series_.Clear();
  last_values_.ClearValues();
  snapshots_.ShowLive();

  TELEMETRY_LOG_INFO("Measurement started", {IntField("active_metrics", static_cast<std::int64_t>(selection_.ActiveIds().size()))});
}

bool TelemetryEngine::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!session_.Stop()) {
    return false;
  }
  TELEMETRY_LOG_INFO("Measurement stopped", {IntField("samples", static_cast<std::int64_t>(session_.sample_index())),
                                             DoubleField("elapsed_s", session_.elapsed_s())});
  return true;
}

void TelemetryEngine::ConfigureDuration(double value, state::DurationUnit unit) {
  std::lock_guard<std::mutex> lock(mutex_);
  session_.ConfigureDuration(value, unit);
}

bool TelemetryEngine::Tick() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!session_.ShouldAutoStop()) {
    return false;
  }
  session_.Stop();
  TELEMETRY_LOG_INFO("Measurement reached its duration limit", {IntField("samples", static_cast<std::int64_t>(session_.sample_index())),
                                                                DoubleField("elapsed_s", session_.elapsed_s())});
  return true;
}

std::shared_ptr<const state::SeriesSnapshot> TelemetryEngine::Save() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (series_.empty()) {
    throw util::EmptyRecording("no samples recorded");
  }

  std::unordered_map<std::string, std::vector<state::SampleValue>> values;
  for (const auto& metric_id : series_.Ids()) {
    values.emplace(metric_id, series_.Values(metric_id));
  }
  auto snapshot = snapshots_.Append(series_.Times(), series_.Ids(), std::move(values));

  series_.Clear();
  last_values_.ClearValues();
  session_.Finish();
  snapshots_.ShowLive();

  TELEMETRY_LOG_INFO("Series saved", {StringField("name", snapshot->name), IntField("samples", static_cast<std::int64_t>(snapshot->times.size()))});
  return snapshot;
}

void TelemetryEngine::ClearAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  snapshots_.ClearAll();
  session_.Finish();
  series_.Clear();
  last_values_.ClearValues();

  TELEMETRY_LOG_INFO("Saved series cleared");
}

state::SessionStatus TelemetryEngine::Status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_.Status();
}

bool TelemetryEngine::SelectForDisplay(const std::optional<std::string>& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool                  showing_series = snapshots_.SelectForDisplay(name);
  if (showing_series) {
    session_.Stop();
  }
  return showing_series;
}

std::vector<std::string> TelemetryEngine::SnapshotNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshots_.Names();
}

std::vector<std::shared_ptr<const state::SeriesSnapshot>> TelemetryEngine::Snapshots() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshots_.Snapshots();
}

View TelemetryEngine::CurrentView() const {
  std::lock_guard<std::mutex> lock(mutex_);

  View view;
  view.session = session_.Status();
  view.live    = snapshots_.live();

  if (view.live) {
    view.times         = series_.Times();
    view.last_time     = last_values_.last_elapsed_s;
    view.dropped_count = last_values_.dropped_count;
    for (const auto& metric_id : selection_.ActiveIds()) {
      view.metrics.push_back({metric_id, series_.Values(metric_id), last_values_.Get(metric_id)});
    }
    return view;
  }

  auto snapshot = snapshots_.Displayed();
  if (!snapshot) {
    return view;
  }
  view.series_name = snapshot->name;
  view.times       = snapshot->times;
  if (!snapshot->times.empty()) {
    view.last_time = snapshot->times.back();
  }
  for (const auto& metric_id : snapshot->metric_ids) {
    MetricView metric;
    metric.qualified_id = metric_id;
    if (const auto* values = snapshot->ValuesFor(metric_id)) {
      metric.values = *values;
      if (!values->empty()) {
        metric.last = values->back();
      }
    }
    view.metrics.push_back(std::move(metric));
  }
  return view;
}

std::vector<std::string> TelemetryEngine::SelectedSensors() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return selection_.Sensors();
}

std::vector<std::string> TelemetryEngine::ActiveIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return selection_.ActiveIds();
}

state::ChannelMap TelemetryEngine::Channels() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return selection_.Channels();
}

std::set<std::string> TelemetryEngine::SubscribedTopics() const {
  std::lock_guard<std::mutex> lock(subscription_mutex_);
  return topics_;
}

std::size_t TelemetryEngine::BufferedSamples() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return series_.size();
}

double TelemetryEngine::SamplePeriodFor(const std::string& sensor_id) const {
  return catalog_->ProfileFor(sensor_id).sample_period_s.value_or(options_.default_sample_period_s);
}

void TelemetryEngine::ResetLiveLocked() {
  series_.Clear();
  last_values_.Clear();
  session_.Reset();
}

void TelemetryEngine::ReconcileLocked() {
  series_.Reconcile(selection_.ActiveIds());
  last_values_.Reconcile(selection_.ActiveIds());
}

} // namespace telemetry::core
