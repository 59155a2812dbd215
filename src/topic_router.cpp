// topic_router.cpp

#include "topic_router.h"

#include <utility>

#include "json_codec.h"

namespace oscbridge {

TopicRouter::TopicRouter(const RelayConfig& config, OscTransport& transport,
                         std::function<void()> on_status_check, const ComponentLogger& logger)
    : config_(config),
      transport_(transport),
      on_status_check_(std::move(on_status_check)),
      logger_(logger),
      send_topic_(config.mqtt_topic + "/send"),
      bundle_send_topic_(config.mqtt_topic + "/bundle/send"),
      status_check_topic_(config.mqtt_topic + "/status/check") {
}

std::vector<std::string> TopicRouter::subscriptions() const {
  std::vector<std::string> topics{send_topic_ + "/#", bundle_send_topic_, status_check_topic_};
  for (const auto& mapping : config_.commands) {
    if (!mapping.mqtt_topic.empty()) topics.push_back(mapping.mqtt_topic);
    if (!mapping.mqtt_sub_topic.empty()) {
      topics.push_back(config_.mqtt_topic + "/" + mapping.mqtt_sub_topic);
    }
  }
  return topics;
}

void TopicRouter::route(const std::string& topic, const std::string& payload) const {
  if (route_mappings(topic, payload)) return;

  if (topic == send_topic_ || topic.rfind(send_topic_ + "/", 0) == 0) {
    send_arbitrary(topic, payload);
  } else if (topic == bundle_send_topic_) {
    send_bundle(payload);
  } else if (topic == status_check_topic_) {
    if (on_status_check_) on_status_check_();
  }
}

bool TopicRouter::route_mappings(const std::string& topic, const std::string& payload) const {
  bool fired = false;
  for (const auto& mapping : config_.commands) {
    const bool hit =
        (!mapping.mqtt_topic.empty() && topic == mapping.mqtt_topic) ||
        (!mapping.mqtt_sub_topic.empty() && topic == config_.mqtt_topic + "/" + mapping.mqtt_sub_topic);
    if (!hit) continue;
    fired = true;

    ControlMessage message{mapping.command, mapping.default_payload};
    if (!mapping.disallow_payload && !payload.empty()) {
      try {
        message.arguments = parse_arguments(payload);
      } catch (const CodecError& e) {
        logger_.error("Payload for %s: %s", mapping.command.c_str(), e.what());
        continue;
      }
    }
    dispatch(message);
  }
  return fired;
}

void TopicRouter::send_arbitrary(const std::string& topic, const std::string& payload) const {
  if (config_.osc_disallow_arbitrary_command) {
    logger_.error("Arbitrary commands are disabled on this relay, dropping %s", topic.c_str());
    return;
  }

  ControlMessage message;
  message.address = topic.substr(send_topic_.size());
  if (message.address.empty()) message.address = "/";

  if (!payload.empty()) {
    try {
      message.arguments = parse_arguments(payload);
    } catch (const CodecError& e) {
      logger_.error("Payload for %s: %s", message.address.c_str(), e.what());
      return;
    }
  }
  dispatch(message);
}

void TopicRouter::send_bundle(const std::string& payload) const {
  if (config_.osc_disallow_arbitrary_command) {
    logger_.error("Arbitrary commands are disabled on this relay, dropping bundle");
    return;
  }

  ControlBundle bundle;
  try {
    bundle = parse_bundle(payload);
  } catch (const CodecError& e) {
    logger_.error("Bundle payload: %s", e.what());
    return;
  }
  dispatch(bundle);
}

void TopicRouter::dispatch(const Packet& packet) const {
  try {
    transport_.send(packet);
  } catch (const TransportError& e) {
    logger_.error("Send Error: %s", e.what());
  } catch (const CodecError& e) {
    logger_.error("Send Error: %s", e.what());
  }
}

}  // namespace oscbridge
