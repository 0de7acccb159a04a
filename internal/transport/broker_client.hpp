#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "delivery_queue.hpp"
#include "transport.hpp"

namespace telemetry::transport {

class Broker;

/*
  Transport backed by an in-process Broker.

  Each connected client owns a delivery thread that hands queued messages
  to the message handler one at a time.
*/
class BrokerClient final : public Transport {
 public:
  BrokerClient(std::shared_ptr<Broker> broker, std::string name, std::size_t queue_capacity = DeliveryQueue::kDefaultCapacity);
  ~BrokerClient() override;

  BrokerClient(const BrokerClient&)            = delete;
  BrokerClient& operator=(const BrokerClient&) = delete;

  int  Connect(const ConnectOptions& options) override;
  void Disconnect() override;
  bool IsConnected() const override;

  void Subscribe(const std::string& filter) override;
  void Unsubscribe(const std::string& filter) override;

  void SetMessageHandler(MessageHandler handler) override;
  void SetConnectedHandler(ConnectedHandler handler) override;

  // Called by the broker while routing a publish.
  void Deliver(Message message);

  const std::string& name() const {
    return name_;
  }

  // Messages dropped because the delivery queue was full.
  std::uint64_t DroppedMessages() const {
    return queue_.dropped();
  }

 private:
  void Run();

  std::shared_ptr<Broker> broker_;
  std::string             name_;

  DeliveryQueue     queue_;
  std::thread       thread_;
  std::atomic<bool> connected_{false};
  std::mutex        connection_mutex_;

  mutable std::mutex handler_mutex_;
  MessageHandler     on_message_;
  ConnectedHandler   on_connected_;
};

} // namespace telemetry::transport
