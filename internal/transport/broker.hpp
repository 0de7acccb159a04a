#pragma once

#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "transport.hpp"

namespace telemetry::transport {

class BrokerClient;

struct BrokerAccount {
  std::string              username;
  std::string              password;
  // Filters the account may subscribe to (or below); empty means all.
  std::vector<std::string> allowed_filters;
};

/*
  In-process topic router.

  Clients attach with credentials, subscribe with MQTT-style filters and
  receive every publish whose topic matches one of their filters, once per
  client. With no accounts configured every connection is accepted.
*/
class Broker {
 public:
  explicit Broker(std::vector<BrokerAccount> accounts = {});

  Broker(const Broker&)            = delete;
  Broker& operator=(const Broker&) = delete;

  // Returns kConnectionAccepted or kNotAuthorized.
  int  Attach(BrokerClient* client, const ConnectOptions& options);
  void Detach(BrokerClient* client);

  // Throws util::SubscriptionError when detached, the filter is malformed
  // or the account may not use it.
  void AddSubscription(BrokerClient* client, const std::string& filter);
  void RemoveSubscription(BrokerClient* client, const std::string& filter);

  // Routes to every matching client; returns the number of deliveries.
  // Throws util::InvalidArgument for empty or wildcard topics.
  std::size_t Publish(const std::string& topic, const std::string& payload);

  std::size_t ConnectedClients() const;
  std::size_t Subscriptions(BrokerClient* client) const;

 private:
  struct ClientSession {
    std::string              username;
    std::vector<std::string> allowed_filters;
    std::set<std::string>    filters;
  };

  const BrokerAccount* Authenticate(const ConnectOptions& options) const;
  static bool          Permits(const ClientSession& session, const std::string& filter);

  mutable std::mutex                                mutex_;
  std::vector<BrokerAccount>                        accounts_;
  std::unordered_map<BrokerClient*, ClientSession> sessions_;
};

} // namespace telemetry::transport
