#pragma once
// topic_router.h: Turns one inbound MQTT message into OSC traffic.
//
// Pre-defined command mappings are checked first; when any of them fires,
// the generic topics under the relay namespace are not considered.

#include <functional>
#include <string>
#include <vector>

#include "component_logger.h"
#include "osc_transport.h"
#include "oscbridge/relay_config.hpp"

namespace oscbridge {

class TopicRouter {
 public:
  TopicRouter(const RelayConfig& config, OscTransport& transport,
              std::function<void()> on_status_check, const ComponentLogger& logger);

  // Never throws: decode and send failures are logged per action.
  void route(const std::string& topic, const std::string& payload) const;

  // Every topic route() can act on, in subscription order.
  std::vector<std::string> subscriptions() const;

 private:
  const RelayConfig& config_;
  OscTransport& transport_;
  std::function<void()> on_status_check_;
  const ComponentLogger& logger_;

  std::string send_topic_;
  std::string bundle_send_topic_;
  std::string status_check_topic_;

  bool route_mappings(const std::string& topic, const std::string& payload) const;
  void send_arbitrary(const std::string& topic, const std::string& payload) const;
  void send_bundle(const std::string& payload) const;
  void dispatch(const Packet& packet) const;
};

}  // namespace oscbridge
