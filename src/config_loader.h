#pragma once
// config_loader.h: JSON configuration file <-> RelayConfig.
//
//   {
//     "relays": [
//       {
//         "mqtt_host": "localhost", "mqtt_port": 1883, "mqtt_topic": "osc/mixer",
//         "osc_host": "192.168.1.20", "osc_port": 10023,
//         "relay_commands": [{"command": "/ch/01/mix/on", "mqtt_sub_topic": "ch1/on"}],
//         "osc_subscriptions": [{"command": "/xremote", "interval": "9s"}]
//       }
//     ]
//   }
//
// Loading produces drafts; validate_relays() must run before use.

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

#include "config_validator.h"
#include "oscbridge/relay_config.hpp"

namespace oscbridge {

// Candidate locations, checked in order after an explicit --config path.
std::vector<std::string> default_config_paths();

// Return the first existing file among `explicit_path` (if non-empty) and
// default_config_paths(). Throws ConfigError when none exists.
std::string find_config_file(const std::string& explicit_path);

std::vector<RelayConfig> load_config_file(const std::string& path);
std::vector<RelayConfig> parse_config(const nlohmann::json& doc);

// "1h2m3.5s", "250ms", "10us", ... Bare integers are milliseconds.
std::chrono::milliseconds parse_duration(const std::string& text);
std::string format_duration(std::chrono::milliseconds d);

// Status snapshot published on <mqtt_topic>/status. Omits the broker password.
nlohmann::json relay_to_json(const RelayConfig& config);

}  // namespace oscbridge
