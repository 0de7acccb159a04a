#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace telemetry::transport {

struct ConnectOptions {
  std::string   host;
  std::uint16_t port{1883};
  std::string   username;
  std::string   password;
  std::string   client_id;
};

// Connection result codes, MQTT numbering.
constexpr int kConnectionAccepted = 0;
constexpr int kNotAuthorized      = 5;

using MessageHandler   = std::function<void(const std::string& topic, const std::string& payload)>;
using ConnectedHandler = std::function<void(int result_code)>;

/*
  Publish/subscribe client as seen by the engine.

  Subscribe/Unsubscribe throw util::SubscriptionError on failure. Handlers
  run on the transport's delivery context, one message at a time, and must
  not throw.
*/
class Transport {
 public:
  virtual ~Transport() = default;

  virtual int  Connect(const ConnectOptions& options) = 0;
  virtual void Disconnect()                           = 0;
  virtual bool IsConnected() const                    = 0;

  virtual void Subscribe(const std::string& filter)   = 0;
  virtual void Unsubscribe(const std::string& filter) = 0;

  virtual void SetMessageHandler(MessageHandler handler)     = 0;
  virtual void SetConnectedHandler(ConnectedHandler handler) = 0;
};

} // namespace telemetry::transport
