#pragma once
// relay.h: One MQTT namespace bridged to one OSC endpoint.
//
// Threads feeding a relay:
//   broker  : Paho client thread: MQTT message → TopicRouter → OSC send
//   osc-rx  : inside the transport (server mode): datagram → MQTT publish
//   schedule: one per ScheduledPush: periodic OSC send

#include <memory>
#include <string>

#include "broker_client.h"
#include "component_logger.h"
#include "logger.h"
#include "osc_transport.h"
#include "oscbridge/relay_config.hpp"
#include "subscription_scheduler.h"
#include "topic_router.h"

namespace oscbridge {

class Relay {
 public:
  Relay(RelayConfig config, std::unique_ptr<BrokerClient> broker,
        std::unique_ptr<OscTransport> transport, Logger& logger);
  ~Relay();

  Relay(const Relay&) = delete;
  Relay& operator=(const Relay&) = delete;

  // Connect, bind, subscribe, start the scheduler and announce the config.
  // Throws BrokerError or TransportError; the relay is unusable afterwards.
  void start();
  void stop();

  // Publish the configuration snapshot to <mqtt_topic>/status, retained.
  void send_status();

 private:
  RelayConfig config_;
  ComponentLogger logger_;
  std::unique_ptr<BrokerClient> broker_;
  std::unique_ptr<OscTransport> transport_;
  TopicRouter router_;
  SubscriptionScheduler scheduler_;

  void on_broker_message(const std::string& topic, const std::string& payload);
  void on_datagram(const char* data, size_t size);
  void publish(const std::string& topic, const std::string& payload);
};

}  // namespace oscbridge
