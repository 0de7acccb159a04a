#include "monitor_service.hpp"

#include <chrono>
#include <optional>
#include <set>
#include <type_traits>

#include "config/config.pb.h"
#include "internal/catalog/metric_catalog.hpp"
#include "internal/core/telemetry_engine.hpp"
#include "internal/discovery/discovery_tracker.hpp"
#include "internal/export/csv_exporter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace telemetry::service {

using namespace telemetry::monitor::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      telemetry::observability::Metrics::Instance().RecordRequest(route, true);
      telemetry::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return;
    } else {
      auto result = fn();
      telemetry::observability::Metrics::Instance().RecordRequest(route, true);
      telemetry::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return result;
    }
  } catch (const std::exception& ex) {
    TELEMETRY_LOG_WARN("RPC failed", {telemetry::observability::StringField("route", route),
                                      telemetry::observability::StringField("error", ex.what())});
    telemetry::observability::Metrics::Instance().RecordRequest(route, false);
    telemetry::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

telemetry::monitor::v1::SessionState ToProto(telemetry::state::SessionState state) {
  switch (state) {
    case telemetry::state::SessionState::kIdle:
      return SESSION_STATE_IDLE;
    case telemetry::state::SessionState::kRunning:
      return SESSION_STATE_RUNNING;
    case telemetry::state::SessionState::kStopped:
      return SESSION_STATE_STOPPED;
  }
  return SESSION_STATE_UNSPECIFIED;
}

void FillStatus(const telemetry::state::SessionStatus& status, telemetry::monitor::v1::SessionStatus* out) {
  out->set_state(ToProto(status.state));
  out->set_sample_index(status.sample_index);
  out->set_elapsed_s(status.elapsed_s);
  if (status.duration_limit_s) {
    out->set_duration_limit_s(*status.duration_limit_s);
  }
}

void FillOptional(const std::optional<double>& value, OptionalDouble* out) {
  if (value) {
    out->set_value(*value);
  }
}

SessionResponse StatusResponse(const telemetry::core::TelemetryEngine& engine) {
  SessionResponse resp;
  FillStatus(engine.Status(), resp.mutable_session());
  return resp;
}

} // namespace

MonitorService::MonitorService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListSensorsResponse MonitorService::ListSensors() {
  return ObserveRpc("ListSensors", [&]() {
    const double now      = telemetry::util::NowSeconds();
    const double stale_s  = ctx_.config->discovery().stale_after_s();
    const auto   selected = ctx_.engine->SelectedSensors();
    const std::set<std::string> selected_set(selected.begin(), selected.end());

    ListSensorsResponse resp;
    for (const auto& [sensor_id, last_seen] : ctx_.discovery->Entries()) {
      const double age = now - last_seen;
      if (stale_s > 0.0 && age > stale_s) {
        continue;
      }

      const auto& profile = ctx_.engine->catalog().ProfileFor(sensor_id);
      auto*       info    = resp.add_sensors();
      info->set_sensor_id(sensor_id);
      info->set_type(telemetry::catalog::SensorTypeOf(sensor_id));
      info->set_display_name(profile.display_name.empty() ? sensor_id : profile.display_name);
      info->set_selected(selected_set.count(sensor_id) != 0);
      info->set_age_s(age);
    }
    return resp;
  });
}

ListMetricsResponse MonitorService::ListMetrics(const ListMetricsRequest& req) {
  return ObserveRpc("ListMetrics", [&]() {
    std::vector<std::string> sensor_ids(req.sensor_ids().begin(), req.sensor_ids().end());
    if (sensor_ids.empty()) {
      sensor_ids = ctx_.engine->SelectedSensors();
    }

    const auto selected = ctx_.engine->SelectedSensors();
    const std::set<std::string> selected_set(selected.begin(), selected.end());
    const auto channels = ctx_.engine->Channels();

    ListMetricsResponse resp;
    for (const auto& sensor_id : telemetry::state::ActiveSelection::Normalize(sensor_ids)) {
      const auto& profile     = ctx_.engine->catalog().ProfileFor(sensor_id);
      auto        restriction = channels.find(sensor_id);

      for (const auto& metric : profile.metrics) {
        auto* descriptor = resp.add_metrics();
        descriptor->set_qualified_id(telemetry::state::QualifiedMetricId(sensor_id, metric.id));
        descriptor->set_sensor_id(sensor_id);
        descriptor->set_metric_id(metric.id);
        descriptor->set_label(metric.label);
        descriptor->set_unit(metric.unit);
        descriptor->set_color(metric.color);
        descriptor->set_hover_name(metric.hover_name);
        descriptor->set_scale(metric.scale);
        descriptor->set_default_enabled(metric.default_enabled);
        descriptor->set_active(selected_set.count(sensor_id) != 0 &&
                               (restriction == channels.end() || restriction->second.count(metric.id) != 0));
      }
    }
    return resp;
  });
}

SetSensorsResponse MonitorService::SetSensors(const SetSensorsRequest& req) {
  return ObserveRpc("SetSensors", [&]() {
    auto change = ctx_.engine->SetSensors({req.sensor_ids().begin(), req.sensor_ids().end()});

    SetSensorsResponse resp;
    for (const auto& sensor_id : change.selected) {
      resp.add_selected_sensors(sensor_id);
    }
    for (const auto& metric_id : change.active_ids) {
      resp.add_active_metric_ids(metric_id);
    }
    resp.set_reset(change.reset);
    return resp;
  });
}

SetChannelsResponse MonitorService::SetChannels(const SetChannelsRequest& req) {
  return ObserveRpc("SetChannels", [&]() {
    if (req.channels_size() == 0) {
      throw telemetry::util::InvalidArgument("no channel selection given");
    }

    telemetry::state::ChannelMap channels;
    for (const auto& selection : req.channels()) {
      if (selection.sensor_id().empty()) {
        throw telemetry::util::InvalidArgument("channel selection without sensor_id");
      }
      channels[selection.sensor_id()] = {selection.metric_ids().begin(), selection.metric_ids().end()};
    }

    SetChannelsResponse resp;
    for (const auto& metric_id : ctx_.engine->SetChannelMap(channels)) {
      resp.add_active_metric_ids(metric_id);
    }
    return resp;
  });
}

SessionResponse MonitorService::StartSession() {
  return ObserveRpc("StartSession", [&]() {
    ctx_.engine->Start();
    return StatusResponse(*ctx_.engine);
  });
}

SessionResponse MonitorService::StopSession() {
  return ObserveRpc("StopSession", [&]() {
    ctx_.engine->Stop();
    return StatusResponse(*ctx_.engine);
  });
}

SessionResponse MonitorService::ConfigureDuration(const ConfigureDurationRequest& req) {
  return ObserveRpc("ConfigureDuration", [&]() {
    const auto unit = req.unit() == DURATION_UNIT_MINUTES ? telemetry::state::DurationUnit::kMinutes : telemetry::state::DurationUnit::kSeconds;
    ctx_.engine->ConfigureDuration(req.value(), unit);
    return StatusResponse(*ctx_.engine);
  });
}

SaveSeriesResponse MonitorService::SaveSeries() {
  return ObserveRpc("SaveSeries", [&]() {
    const auto snapshot = ctx_.engine->Save();

    SaveSeriesResponse resp;
    resp.set_name(snapshot->name);
    resp.set_samples(snapshot->times.size());
    return resp;
  });
}

void MonitorService::ClearAll() {
  ObserveRpc("ClearAll", [&]() { ctx_.engine->ClearAll(); });
}

SelectForDisplayResponse MonitorService::SelectForDisplay(const SelectForDisplayRequest& req) {
  return ObserveRpc("SelectForDisplay", [&]() {
    std::optional<std::string> name;
    if (!req.name().empty()) {
      name = req.name();
    }

    SelectForDisplayResponse resp;
    const bool showing_series = ctx_.engine->SelectForDisplay(name);
    resp.set_live(!showing_series);
    if (showing_series) {
      resp.set_series_name(*name);
    }
    return resp;
  });
}

ListSeriesResponse MonitorService::ListSeries() {
  return ObserveRpc("ListSeries", [&]() {
    ListSeriesResponse resp;
    for (const auto& name : ctx_.engine->SnapshotNames()) {
      resp.add_names(name);
    }
    return resp;
  });
}

GetViewResponse MonitorService::GetView() {
  return ObserveRpc("GetView", [&]() {
    const auto view = ctx_.engine->CurrentView();

    GetViewResponse resp;
    auto*           out = resp.mutable_view();
    out->set_live(view.live);
    out->set_series_name(view.series_name);
    for (double t : view.times) {
      out->add_times(t);
    }
    if (view.last_time) {
      out->set_last_time(*view.last_time);
    }
    for (const auto& metric : view.metrics) {
      auto* series = out->add_metrics();
      series->set_qualified_id(metric.qualified_id);
      for (const auto& value : metric.values) {
        FillOptional(value, series->add_values());
      }
      FillOptional(metric.last, series->mutable_last());
    }
    if (view.dropped_count) {
      out->set_dropped_count(*view.dropped_count);
    }
    FillStatus(view.session, out->mutable_session());
    return resp;
  });
}

ExportCsvResponse MonitorService::ExportCsv(const ExportCsvRequest& req) {
  return ObserveRpc("ExportCsv", [&]() {
    const auto snapshots = ctx_.engine->Snapshots();
    if (snapshots.empty()) {
      throw telemetry::util::EmptyRecording("no saved series to export");
    }

    auto document = telemetry::csv::ExportSeries(snapshots);

    ExportCsvResponse resp;
    resp.set_rows(document.rows);
    if (req.write_file()) {
      const auto& path = ctx_.config->exports().csv_path();
      telemetry::csv::WriteFile(path, document.text);
      resp.set_path(path);
      TELEMETRY_LOG_INFO("Series exported", {telemetry::observability::StringField("path", path),
                                             telemetry::observability::IntField("rows", static_cast<std::int64_t>(document.rows))});
    }
    resp.set_csv(std::move(document.text));
    return resp;
  });
}

} // namespace telemetry::service
