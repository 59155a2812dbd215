#pragma once
// paho_broker_client.h: BrokerClient over the Eclipse Paho MQTT C client.
//
// Paho delivers messages on its own thread. When the connection drops, a
// reconnect worker retries once per kReconnectDelay and re-subscribes every
// topic once the broker accepts the session again.

#include <MQTTClient.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "broker_client.h"
#include "component_logger.h"

namespace oscbridge {

struct BrokerOptions {
  std::string host;
  int port = 0;
  std::string client_id;
  std::string user;
  std::string password;
};

class PahoBrokerClient final : public BrokerClient {
 public:
  static constexpr int kKeepAliveSeconds = 30;
  static constexpr int kConnectTimeoutSeconds = 30;
  static constexpr std::chrono::seconds kReconnectDelay{1};

  PahoBrokerClient(BrokerOptions options, const ComponentLogger& logger);
  ~PahoBrokerClient() override;

  PahoBrokerClient(const PahoBrokerClient&) = delete;
  PahoBrokerClient& operator=(const PahoBrokerClient&) = delete;

  void set_message_handler(MessageHandler handler) override;
  void connect() override;
  void disconnect() override;
  void subscribe(const std::string& topic) override;
  void publish(const std::string& topic, const std::string& payload, bool retain) override;

 private:
  BrokerOptions options_;
  std::string uri_;
  ComponentLogger logger_;
  MessageHandler handler_;
  MQTTClient client_ = nullptr;

  std::mutex mu_;
  std::condition_variable cv_;
  bool running_{false};
  bool connection_lost_{false};
  std::vector<std::string> topics_;
  std::thread reconnect_thread_;

  int try_connect();
  void reconnect_loop();

  static int on_message_arrived(void* context, char* topic_name, int topic_len,
                                MQTTClient_message* message);
  static void on_connection_lost(void* context, char* cause);
};

}  // namespace oscbridge
