#pragma once
// oscbridge/relay_config.hpp: Per-relay configuration.
//
// A RelayConfig is built by the config loader, checked by validate_relays()
// and then handed by value to exactly one Relay, which never mutates it.

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "oscbridge/osc_types.hpp"

namespace oscbridge {

// Verbosity threshold. A record is emitted when its level <= the threshold.
enum class LogLevel : uint8_t { Error = 0, Receive = 1, Send = 2, Debug = 3 };

constexpr const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Receive:
      return "RECV";
    case LogLevel::Send:
      return "SEND";
    case LogLevel::Debug:
      return "DEBUG";
  }
  return "?";
}

// Pre-defined MQTT topic -> OSC command mapping.
struct CommandMapping {
  std::string command;         // OSC address to send
  std::string mqtt_topic;      // absolute topic
  std::string mqtt_sub_topic;  // relative to RelayConfig::mqtt_topic
  bool disallow_payload = false;
  ArgumentList default_payload;  // used when no payload is given or allowed
};

// OSC message re-sent on a fixed interval (data subscriptions on mixers etc).
struct ScheduledPush {
  std::string command;
  ArgumentList payload;
  std::chrono::milliseconds interval{0};
};

struct RelayConfig {
  std::string mqtt_host;
  int mqtt_port = 0;
  std::string mqtt_client_id;
  std::string mqtt_user;
  std::string mqtt_password;
  // Namespace root: <mqtt_topic>/cmd, /send, /bundle, /bundle/send, /status, /status/check.
  std::string mqtt_topic;
  bool mqtt_disable_config_send = false;

  std::string osc_host;
  int osc_port = 0;
  std::string osc_bind_addr;
  int osc_bind_port = 0;  // defaults to osc_port when osc_bind_addr is set
  bool osc_disallow_arbitrary_command = false;

  std::vector<CommandMapping> commands;
  std::vector<ScheduledPush> osc_subscriptions;

  LogLevel log_level = LogLevel::Error;

  // A local OSC server socket is opened.
  bool server_enabled() const {
    return !osc_bind_addr.empty() && osc_bind_port != 0;
  }

  // Server socket plus a peer: sends and receives share the bound socket.
  bool bidirectional() const {
    return server_enabled() && !osc_host.empty() && osc_port != 0;
  }
};

}  // namespace oscbridge
