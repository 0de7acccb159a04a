#include "broker_service.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/transport/broker.hpp"

namespace telemetry::service {

using namespace telemetry::monitor::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& topic, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    telemetry::observability::Metrics::Instance().RecordRequest(route, true);
    telemetry::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return result;
  } catch (const std::exception& ex) {
    TELEMETRY_LOG_WARN("RPC failed", {telemetry::observability::StringField("route", route), telemetry::observability::StringField("topic", topic),
                                      telemetry::observability::StringField("error", ex.what())});
    telemetry::observability::Metrics::Instance().RecordRequest(route, false);
    telemetry::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

} // namespace

BrokerService::BrokerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PublishResponse BrokerService::Publish(const PublishRequest& req) {
  return ObserveRpc("Publish", req.topic(), [&]() {
    const auto deliveries = ctx_.broker->Publish(req.topic(), req.payload());

    TELEMETRY_LOG_DEBUG("Message published", {telemetry::observability::StringField("topic", req.topic()),
                                              telemetry::observability::IntField("deliveries", static_cast<std::int64_t>(deliveries))});

    PublishResponse resp;
    resp.set_deliveries(deliveries);
    resp.set_messages(1);
    return resp;
  });
}

} // namespace telemetry::service
