#include "broker_client.hpp"

#include <utility>

#include "broker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace telemetry::transport {

using telemetry::observability::IntField;
using telemetry::observability::StringField;

BrokerClient::BrokerClient(std::shared_ptr<Broker> broker, std::string name, std::size_t queue_capacity)
    : broker_(std::move(broker)), name_(std::move(name)), queue_(queue_capacity) {
}

BrokerClient::~BrokerClient() {
  Disconnect();
}

int BrokerClient::Connect(const ConnectOptions& options) {
  int result_code = kNotAuthorized;
  {
    std::lock_guard lock(connection_mutex_);
    if (connected_) {
      broker_->Detach(this);
      queue_.Shutdown();
      if (thread_.joinable()) thread_.join();
      connected_ = false;
    }

    queue_.Reset();
    result_code = broker_->Attach(this, options);
    if (result_code == kConnectionAccepted) {
      connected_ = true;
      thread_    = std::thread(&BrokerClient::Run, this);
    }
  }

  TELEMETRY_LOG_INFO("Transport connection", {StringField("client", name_), StringField("host", options.host),
                                               IntField("port", options.port), IntField("result_code", result_code)});

  ConnectedHandler handler;
  {
    std::lock_guard lock(handler_mutex_);
    handler = on_connected_;
  }
  if (handler) handler(result_code);

  return result_code;
}

void BrokerClient::Disconnect() {
  std::lock_guard lock(connection_mutex_);
  if (!connected_) return;

  broker_->Detach(this);
  queue_.Shutdown();
  if (thread_.joinable()) thread_.join();
  connected_ = false;
}

bool BrokerClient::IsConnected() const {
  return connected_;
}

void BrokerClient::Subscribe(const std::string& filter) {
  broker_->AddSubscription(this, filter);
}

void BrokerClient::Unsubscribe(const std::string& filter) {
  broker_->RemoveSubscription(this, filter);
}

void BrokerClient::SetMessageHandler(MessageHandler handler) {
  std::lock_guard lock(handler_mutex_);
  on_message_ = std::move(handler);
}

void BrokerClient::SetConnectedHandler(ConnectedHandler handler) {
  std::lock_guard lock(handler_mutex_);
  on_connected_ = std::move(handler);
}

void BrokerClient::Deliver(Message message) {
  if (!queue_.Enqueue(std::move(message))) {
    const auto dropped = queue_.dropped();
    // First drop, then every thousandth.
    if (dropped % 1000 == 1) {
      TELEMETRY_LOG_WARN("Delivery queue full, dropping oldest message",
                         {StringField("client", name_), IntField("capacity", static_cast<std::int64_t>(queue_.capacity())),
                          IntField("dropped", static_cast<std::int64_t>(dropped))});
    }
  }
}

void BrokerClient::Run() {
  while (true) {
    auto message = queue_.Dequeue();
    if (!message) break;

    MessageHandler handler;
    {
      std::lock_guard lock(handler_mutex_);
      handler = on_message_;
    }
    if (!handler) continue;

    try {
      handler(message->topic, message->payload);
    } catch (const std::exception& e) {
      TELEMETRY_LOG_ERROR("Message handler failed",
                          {StringField("client", name_), StringField("topic", message->topic), StringField("error", e.what())});
    }
  }
}

} // namespace telemetry::transport
