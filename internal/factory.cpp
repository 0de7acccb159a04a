#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/catalog/metric_catalog.hpp"
#include "internal/core/telemetry_engine.hpp"
#include "internal/discovery/discovery_tracker.hpp"
#include "internal/grpc/broker_server.hpp"
#include "internal/grpc/monitor_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/poller.hpp"
#include "internal/service/broker_service.hpp"
#include "internal/service/monitor_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/state/time_series.hpp"
#include "internal/transport/broker.hpp"
#include "internal/transport/broker_client.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace telemetry::factory {

using telemetry::observability::IntField;
using telemetry::observability::StringField;

namespace {

std::vector<transport::BrokerAccount> BuildAccounts(const runtime::config::BrokerConfig& config) {
  std::vector<transport::BrokerAccount> accounts;
  for (const auto& account : config.accounts()) {
    transport::BrokerAccount entry;
    entry.username = account.username();
    entry.password = account.password();
    entry.allowed_filters.assign(account.allowed_filters().begin(), account.allowed_filters().end());
    accounts.push_back(std::move(entry));
  }
  return accounts;
}

transport::ConnectOptions BuildConnectOptions(const runtime::config::BrokerConfig& config, const runtime::config::ClientCredentials& credentials,
                                              std::string client_id) {
  transport::ConnectOptions options;
  options.host      = config.host();
  options.port      = static_cast<std::uint16_t>(config.port());
  options.username  = credentials.username();
  options.password  = credentials.password();
  options.client_id = std::move(client_id);
  return options;
}

} // namespace

void Application::Shutdown() {
  if (poller) {
    poller->Stop();
  }
  if (measurement_client) {
    measurement_client->Disconnect();
  }
  if (supervisor_client) {
    supervisor_client->Disconnect();
  }
}

/*
    Build full application dependency graph
*/
Application Build(const runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Catalog and topic layout
  // ------------------------------------------------------------------
  auto metric_catalog = std::make_shared<const catalog::MetricCatalog>(catalog::MetricCatalog::FromConfig(config));

  transport::TopicLayout topics;
  topics.prefix      = config.topics().prefix();
  topics.data_suffix = config.topics().data_suffix();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const auto& recording = config.recording();

  core::EngineOptions options;
  options.topics                  = topics;
  options.default_sample_period_s = 1.0 / recording.sample_hz();
  options.buffer_capacity         = state::TimeSeries::CapacityFor(recording.window_s(), recording.sample_hz(), recording.margin_samples());

  app.engine    = std::make_shared<core::TelemetryEngine>(metric_catalog, options);
  app.discovery = std::make_shared<discovery::DiscoveryTracker>(topics);
  app.broker    = std::make_shared<transport::Broker>(BuildAccounts(config.broker()));

  TELEMETRY_LOG_INFO("Engine configured", {IntField("buffer_capacity", static_cast<std::int64_t>(options.buffer_capacity)),
                                           IntField("sensor_types", static_cast<std::int64_t>(metric_catalog->Types().size())),
                                           StringField("topic_prefix", topics.prefix)});

  // ------------------------------------------------------------------
  // Measurement client: data topics of the selected sensors
  // ------------------------------------------------------------------
  app.measurement_client = std::make_shared<transport::BrokerClient>(app.broker, "measurement", config.broker().queue_capacity());

  std::weak_ptr<core::TelemetryEngine> weak_engine = app.engine;
  app.measurement_client->SetMessageHandler([weak_engine](const std::string& topic, const std::string& payload) {
    if (auto engine = weak_engine.lock()) {
      engine->OnMessage(topic, payload);
    }
  });
  app.measurement_client->SetConnectedHandler([weak_engine](int result_code) {
    if (result_code != transport::kConnectionAccepted) {
      return;
    }
    if (auto engine = weak_engine.lock()) {
      engine->ResubscribeAll();
    }
  });
  app.engine->AttachTransport(app.measurement_client);

  const int measurement_rc =
      app.measurement_client->Connect(BuildConnectOptions(config.broker(), config.broker().measurement(), "telemetry-measurement"));
  if (measurement_rc != transport::kConnectionAccepted) {
    TELEMETRY_LOG_ERROR("Measurement client was refused by the broker", {IntField("result_code", measurement_rc)});
  }

  // ------------------------------------------------------------------
  // Supervisor client: discovery wildcard
  // ------------------------------------------------------------------
  app.supervisor_client = std::make_shared<transport::BrokerClient>(app.broker, "supervisor", config.broker().queue_capacity());

  std::weak_ptr<discovery::DiscoveryTracker> weak_discovery = app.discovery;
  app.supervisor_client->SetMessageHandler([weak_discovery](const std::string& topic, const std::string&) {
    if (auto tracker = weak_discovery.lock()) {
      tracker->OnTopic(topic, util::NowSeconds());
    }
  });

  // The handler is owned by the client it refers to.
  transport::BrokerClient* supervisor = app.supervisor_client.get();
  const std::string        filter     = topics.DiscoveryFilter();
  app.supervisor_client->SetConnectedHandler([supervisor, filter](int result_code) {
    if (result_code != transport::kConnectionAccepted) {
      return;
    }
    try {
      supervisor->Subscribe(filter);
    } catch (const util::SubscriptionError& e) {
      TELEMETRY_LOG_WARN("Discovery subscribe failed", {StringField("filter", filter), StringField("error", e.what())});
    }
  });

  const int supervisor_rc =
      app.supervisor_client->Connect(BuildConnectOptions(config.broker(), config.broker().supervisor(), "telemetry-supervisor"));
  if (supervisor_rc != transport::kConnectionAccepted) {
    TELEMETRY_LOG_ERROR("Supervisor client was refused by the broker", {IntField("result_code", supervisor_rc)});
  }

  // ------------------------------------------------------------------
  // Poller
  // ------------------------------------------------------------------
  runtime::PollerOptions poller_options;
  poller_options.refresh             = std::chrono::milliseconds(recording.refresh_ms());
  poller_options.stale_after_s       = config.discovery().stale_after_s();
  poller_options.drop_stale_selected = config.discovery().drop_stale_selected();

  app.poller = std::make_shared<runtime::Poller>(app.engine, app.discovery, poller_options);
  app.poller->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine    = app.engine;
  ctx.discovery = app.discovery;
  ctx.broker    = app.broker;
  ctx.config    = std::make_shared<const runtime::config::RuntimeConfig>(config);

  auto monitor_service = std::make_shared<service::MonitorService>(ctx);
  auto broker_service  = std::make_shared<service::BrokerService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::MonitorServer>(monitor_service));
  app.grpc_services.push_back(std::make_unique<grpc::BrokerServer>(broker_service));

  return app;
}

} // namespace telemetry::factory
