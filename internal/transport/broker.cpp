#include "broker.hpp"

#include <algorithm>

#include "broker_client.hpp"
#include "internal/util/errors.hpp"
#include "topic.hpp"

namespace telemetry::transport {

Broker::Broker(std::vector<BrokerAccount> accounts) : accounts_(std::move(accounts)) {
}

const BrokerAccount* Broker::Authenticate(const ConnectOptions& options) const {
  for (const auto& account : accounts_) {
    if (account.username == options.username && account.password == options.password) {
      return &account;
    }
  }
  return nullptr;
}

bool Broker::Permits(const ClientSession& session, const std::string& filter) {
  if (session.allowed_filters.empty()) {
    return true;
  }
  return std::any_of(session.allowed_filters.begin(), session.allowed_filters.end(),
                     [&](const std::string& allowed) { return TopicMatches(allowed, filter); });
}

int Broker::Attach(BrokerClient* client, const ConnectOptions& options) {
  std::lock_guard lock(mutex_);

  ClientSession session;
  if (!accounts_.empty()) {
    const auto* account = Authenticate(options);
    if (account == nullptr) {
      return kNotAuthorized;
    }
    session.username        = account->username;
    session.allowed_filters = account->allowed_filters;
  } else {
    session.username = options.username;
  }

  sessions_[client] = std::move(session);
  return kConnectionAccepted;
}

void Broker::Detach(BrokerClient* client) {
  std::lock_guard lock(mutex_);
  sessions_.erase(client);
}

void Broker::AddSubscription(BrokerClient* client, const std::string& filter) {
  std::lock_guard lock(mutex_);

  auto it = sessions_.find(client);
  if (it == sessions_.end()) {
    throw util::SubscriptionError("subscribe to '" + filter + "' on a disconnected client");
  }
  if (!IsValidFilter(filter)) {
    throw util::SubscriptionError("malformed topic filter '" + filter + "'");
  }
  if (!Permits(it->second, filter)) {
    throw util::SubscriptionError("account '" + it->second.username + "' may not subscribe to '" + filter + "'");
  }

  it->second.filters.insert(filter);
}

void Broker::RemoveSubscription(BrokerClient* client, const std::string& filter) {
  std::lock_guard lock(mutex_);

  auto it = sessions_.find(client);
  if (it == sessions_.end()) {
    throw util::SubscriptionError("unsubscribe from '" + filter + "' on a disconnected client");
  }
  it->second.filters.erase(filter);
}

std::size_t Broker::Publish(const std::string& topic, const std::string& payload) {
  if (topic.empty() || topic.find_first_of("+#") != std::string::npos) {
    throw util::InvalidArgument("cannot publish to topic '" + topic + "'");
  }

  std::lock_guard lock(mutex_);

  std::size_t deliveries = 0;
  for (auto& [client, session] : sessions_) {
    const bool matches = std::any_of(session.filters.begin(), session.filters.end(),
                                     [&](const std::string& filter) { return TopicMatches(filter, topic); });
    if (!matches) {
      continue;
    }
    client->Deliver(Message{topic, payload});
    ++deliveries;
  }
  return deliveries;
}

std::size_t Broker::ConnectedClients() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

std::size_t Broker::Subscriptions(BrokerClient* client) const {
  std::lock_guard lock(mutex_);
  auto it = sessions_.find(client);
  return it == sessions_.end() ? 0 : it->second.filters.size();
}

} // namespace telemetry::transport
