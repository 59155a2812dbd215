#pragma once
// broker_client.h: The MQTT operations a relay needs.

#include <functional>
#include <stdexcept>
#include <string>

namespace oscbridge {

class BrokerError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class BrokerClient {
 public:
  // Invoked on the client's own thread for every message on a subscribed topic.
  using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;

  virtual ~BrokerClient() = default;

  // Must be called before connect().
  virtual void set_message_handler(MessageHandler handler) = 0;

  // Blocking. Throws BrokerError (unreachable broker, rejected credentials).
  virtual void connect() = 0;
  virtual void disconnect() = 0;

  // QoS 0. Throws BrokerError.
  virtual void subscribe(const std::string& topic) = 0;
  virtual void publish(const std::string& topic, const std::string& payload, bool retain) = 0;
};

}  // namespace oscbridge
