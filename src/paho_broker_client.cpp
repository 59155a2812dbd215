// paho_broker_client.cpp

#include "paho_broker_client.h"

#include <utility>

namespace oscbridge {

static std::string describe(int rc) {
  // Positive values are CONNACK refusal codes.
  switch (rc) {
    case 1:
      return "unacceptable protocol version";
    case 2:
      return "client identifier rejected";
    case 3:
      return "server unavailable";
    case 4:
      return "bad user name or password";
    case 5:
      return "not authorized";
    default:
      break;
  }
  const char* text = MQTTClient_strerror(rc);
  return text ? text : "error " + std::to_string(rc);
}

PahoBrokerClient::PahoBrokerClient(BrokerOptions options, const ComponentLogger& logger)
    : options_(std::move(options)),
      uri_("tcp://" + options_.host + ":" + std::to_string(options_.port)),
      logger_(logger) {
  int rc = MQTTClient_create(&client_, uri_.c_str(), options_.client_id.c_str(),
                             MQTTCLIENT_PERSISTENCE_NONE, nullptr);
  if (rc != MQTTCLIENT_SUCCESS) {
    throw BrokerError("MQTT client for " + uri_ + ": " + describe(rc));
  }
  rc = MQTTClient_setCallbacks(client_, this, &PahoBrokerClient::on_connection_lost,
                               &PahoBrokerClient::on_message_arrived, nullptr);
  if (rc != MQTTCLIENT_SUCCESS) {
    MQTTClient_destroy(&client_);
    throw BrokerError("MQTT callbacks for " + uri_ + ": " + describe(rc));
  }
}

PahoBrokerClient::~PahoBrokerClient() {
  disconnect();
  MQTTClient_destroy(&client_);
}

void PahoBrokerClient::set_message_handler(MessageHandler handler) {
  handler_ = std::move(handler);
}

int PahoBrokerClient::try_connect() {
  MQTTClient_connectOptions opts = MQTTClient_connectOptions_initializer;
  opts.keepAliveInterval = kKeepAliveSeconds;
  opts.cleansession = 1;
  opts.connectTimeout = kConnectTimeoutSeconds;
  if (!options_.user.empty()) {
    opts.username = options_.user.c_str();
    opts.password = options_.password.c_str();
  }
  return MQTTClient_connect(client_, &opts);
}

void PahoBrokerClient::connect() {
  logger_.debug("Connecting to MQTT %s", uri_.c_str());
  int rc = try_connect();
  if (rc != MQTTCLIENT_SUCCESS) throw BrokerError("MQTT connect to " + uri_ + ": " + describe(rc));

  {
    std::lock_guard lk(mu_);
    running_ = true;
    connection_lost_ = false;
  }
  reconnect_thread_ = std::thread(&PahoBrokerClient::reconnect_loop, this);
}

void PahoBrokerClient::disconnect() {
  {
    std::lock_guard lk(mu_);
    if (!running_) return;
    running_ = false;
  }
  cv_.notify_all();
  if (reconnect_thread_.joinable()) reconnect_thread_.join();
  if (MQTTClient_isConnected(client_)) MQTTClient_disconnect(client_, 1000);
}

void PahoBrokerClient::subscribe(const std::string& topic) {
  logger_.debug("Subscribing MQTT: %s", topic.c_str());
  int rc = MQTTClient_subscribe(client_, topic.c_str(), 0);
  if (rc != MQTTCLIENT_SUCCESS) {
    throw BrokerError("MQTT subscribe " + topic + ": " + describe(rc));
  }
  std::lock_guard lk(mu_);
  topics_.push_back(topic);
}

void PahoBrokerClient::publish(const std::string& topic, const std::string& payload, bool retain) {
  int rc = MQTTClient_publish(client_, topic.c_str(), static_cast<int>(payload.size()),
                              payload.data(), 0, retain ? 1 : 0, nullptr);
  if (rc != MQTTCLIENT_SUCCESS) throw BrokerError("MQTT publish " + topic + ": " + describe(rc));
}

// ── Paho callbacks (client thread) ───────────────────────────────────────────

int PahoBrokerClient::on_message_arrived(void* context, char* topic_name, int topic_len,
                                         MQTTClient_message* message) {
  auto* self = static_cast<PahoBrokerClient*>(context);

  // topic_len is 0 when the name is NUL-terminated.
  std::string topic = topic_len > 0 ? std::string(topic_name, static_cast<size_t>(topic_len))
                                    : std::string(topic_name);
  std::string payload(static_cast<const char*>(message->payload),
                      static_cast<size_t>(message->payloadlen));
  MQTTClient_freeMessage(&message);
  MQTTClient_free(topic_name);

  if (self->handler_) {
    try {
      self->handler_(topic, payload);
    } catch (const std::exception& e) {
      self->logger_.error("MQTT handler for %s: %s", topic.c_str(), e.what());
    }
  }
  return 1;
}

void PahoBrokerClient::on_connection_lost(void* context, char* cause) {
  auto* self = static_cast<PahoBrokerClient*>(context);
  self->logger_.error("MQTT connection to %s lost: %s", self->uri_.c_str(),
                      cause ? cause : "unknown cause");
  {
    std::lock_guard lk(self->mu_);
    self->connection_lost_ = true;
  }
  self->cv_.notify_all();
}

// ── Reconnect worker ─────────────────────────────────────────────────────────

void PahoBrokerClient::reconnect_loop() {
  std::unique_lock lk(mu_);
  while (true) {
    cv_.wait(lk, [this] { return connection_lost_ || !running_; });
    if (!running_) break;

    lk.unlock();
    int rc = try_connect();
    lk.lock();

    if (rc != MQTTCLIENT_SUCCESS) {
      logger_.error("MQTT reconnect to %s: %s", uri_.c_str(), describe(rc).c_str());
      cv_.wait_for(lk, kReconnectDelay, [this] { return !running_; });
      continue;
    }

    connection_lost_ = false;
    const std::vector<std::string> topics = topics_;
    lk.unlock();
    logger_.debug("Reconnected to MQTT %s", uri_.c_str());
    for (const auto& topic : topics) {
      int sub = MQTTClient_subscribe(client_, topic.c_str(), 0);
      if (sub != MQTTCLIENT_SUCCESS) {
        logger_.error("MQTT subscribe %s: %s", topic.c_str(), describe(sub).c_str());
      }
    }
    lk.lock();
  }
}

}  // namespace oscbridge
