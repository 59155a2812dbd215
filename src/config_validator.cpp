// config_validator.cpp

#include "config_validator.h"

#include <string>

namespace oscbridge {

static bool valid_port(int port) {
  return port > 0 && port <= 65535;
}

[[noreturn]] static void fail(size_t index, const std::string& what) {
  throw ConfigError("relay " + std::to_string(index) + ": " + what);
}

static void validate_one(size_t i, const RelayConfig& r) {
  if (r.mqtt_host.empty() || r.mqtt_port == 0) {
    fail(i, "MQTT host and port are required configurations");
  }
  if (!valid_port(r.mqtt_port)) fail(i, "MQTT port " + std::to_string(r.mqtt_port) + " is invalid");
  if (r.mqtt_topic.empty()) fail(i, "MQTT topic is a required configuration");
  if (r.osc_bind_addr.empty() && r.osc_host.empty()) {
    fail(i, "either an OSC bind address or an OSC host must be configured");
  }
  if (r.osc_port != 0 && !valid_port(r.osc_port)) {
    fail(i, "OSC port " + std::to_string(r.osc_port) + " is invalid");
  }
  if (r.osc_bind_port != 0 && !valid_port(r.osc_bind_port)) {
    fail(i, "OSC bind port " + std::to_string(r.osc_bind_port) + " is invalid");
  }
  if (!r.osc_host.empty() && r.osc_port == 0) fail(i, "OSC host is set but OSC port is not");

  for (size_t c = 0; c < r.commands.size(); ++c) {
    const auto& cmd = r.commands[c];
    if (cmd.command.empty()) fail(i, "relay command " + std::to_string(c) + " has no command");
    if (cmd.mqtt_topic.empty() && cmd.mqtt_sub_topic.empty()) {
      fail(i, "relay command " + std::to_string(c) + " needs mqtt_topic or mqtt_sub_topic");
    }
  }

  for (size_t s = 0; s < r.osc_subscriptions.size(); ++s) {
    const auto& sub = r.osc_subscriptions[s];
    if (sub.command.empty()) fail(i, "OSC subscription " + std::to_string(s) + " has no command");
    if (sub.interval.count() <= 0) {
      fail(i, "OSC subscription " + std::to_string(s) + " must have an interval greater than zero");
    }
  }
}

std::vector<RelayConfig> validate_relays(std::vector<RelayConfig> drafts) {
  if (drafts.empty()) throw ConfigError("no relays defined in the configuration");

  for (auto& r : drafts) {
    if (!r.osc_bind_addr.empty() && r.osc_bind_port == 0) r.osc_bind_port = r.osc_port;
  }

  for (size_t i = 0; i < drafts.size(); ++i) {
    validate_one(i, drafts[i]);
    if (!drafts[i].osc_bind_addr.empty() && drafts[i].osc_bind_port == 0) {
      fail(i, "OSC bind address is set but neither osc_bind_port nor osc_port is");
    }
  }

  for (size_t i = 0; i < drafts.size(); ++i) {
    for (size_t j = 0; j < drafts.size(); ++j) {
      if (i == j) continue;
      if (drafts[i].mqtt_topic == drafts[j].mqtt_topic) {
        fail(i, "MQTT topic '" + drafts[i].mqtt_topic + "' is also used by relay " +
                    std::to_string(j));
      }
      if (drafts[i].server_enabled() && drafts[j].server_enabled() &&
          drafts[i].osc_bind_port == drafts[j].osc_bind_port) {
        fail(i, "OSC bind port " + std::to_string(drafts[i].osc_bind_port) +
                    " is also used by relay " + std::to_string(j));
      }
    }
  }
  return drafts;
}

}  // namespace oscbridge
