// config_loader.cpp

#include "config_loader.h"

#include <pwd.h>
#include <unistd.h>

#include <cmath>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <utility>

#include "json_codec.h"

namespace oscbridge {

using nlohmann::json;

static constexpr char kConfigName[] = "config.json";
static constexpr char kLegacyConfigName[] = "config.yaml";
static constexpr char kServiceDir[] = "osc-mqtt-bridge";

// ── Discovery ────────────────────────────────────────────────────────────────

static std::string home_dir() {
  if (const char* home = std::getenv("HOME"); home && *home) return home;
  if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) return pw->pw_dir;
  return {};
}

std::vector<std::string> default_config_paths() {
  std::vector<std::string> paths;
  paths.push_back((std::filesystem::current_path() / kConfigName).string());
  if (auto home = home_dir(); !home.empty()) {
    paths.push_back(home + "/.config/" + kServiceDir + "/" + kConfigName);
  }
  paths.push_back(std::string("/etc/") + kServiceDir + "/" + kConfigName);
  return paths;
}

std::string find_config_file(const std::string& explicit_path) {
  std::error_code ec;
  if (!explicit_path.empty() && std::filesystem::is_regular_file(explicit_path, ec)) {
    return explicit_path;
  }
  for (const auto& path : default_config_paths()) {
    if (std::filesystem::is_regular_file(path, ec)) return path;
  }
  for (const auto& path : default_config_paths()) {
    auto legacy = std::filesystem::path(path).replace_filename(kLegacyConfigName);
    if (std::filesystem::is_regular_file(legacy, ec)) {
      throw ConfigError("found " + legacy.string() + " but YAML is no longer read; convert it to " +
                        path);
    }
  }
  throw ConfigError("unable to find a configuration file");
}

// ── Durations ────────────────────────────────────────────────────────────────

std::chrono::milliseconds parse_duration(const std::string& text) {
  if (text.empty()) throw ConfigError("empty duration");

  char* end = nullptr;
  const long long plain = std::strtoll(text.c_str(), &end, 10);
  if (*end == '\0') return std::chrono::milliseconds(plain);

  double total_ns = 0;
  size_t pos = 0;
  while (pos < text.size()) {
    const char* start = text.c_str() + pos;
    const double value = std::strtod(start, &end);
    if (end == start) throw ConfigError("invalid duration '" + text + "'");
    pos += static_cast<size_t>(end - start);

    size_t unit_end = pos;
    while (unit_end < text.size() && !(text[unit_end] >= '0' && text[unit_end] <= '9') &&
           text[unit_end] != '.') {
      ++unit_end;
    }
    const std::string unit = text.substr(pos, unit_end - pos);
    pos = unit_end;

    double scale = 0;
    if (unit == "ns") scale = 1;
    else if (unit == "us" || unit == "\xC2\xB5s") scale = 1e3;
    else if (unit == "ms") scale = 1e6;
    else if (unit == "s") scale = 1e9;
    else if (unit == "m") scale = 60e9;
    else if (unit == "h") scale = 3600e9;
    else throw ConfigError("invalid duration unit '" + unit + "' in '" + text + "'");
    total_ns += value * scale;
  }
  if (total_ns > 0 && total_ns < 1e6) {
    throw ConfigError("duration '" + text + "' is shorter than the 1ms resolution");
  }
  return std::chrono::milliseconds(static_cast<long long>(std::llround(total_ns / 1e6)));
}

std::string format_duration(std::chrono::milliseconds d) {
  long long ms = d.count();
  if (ms == 0) return "0s";
  std::string out;
  if (ms < 0) {
    out += '-';
    ms = -ms;
  }
  if (ms < 1000) return out + std::to_string(ms) + "ms";

  const long long h = ms / 3'600'000;
  const long long m = (ms / 60'000) % 60;
  const long long s = (ms / 1000) % 60;
  const long long frac = ms % 1000;
  if (h) out += std::to_string(h) + "h";
  if (h || m) out += std::to_string(m) + "m";
  out += std::to_string(s);
  if (frac) {
    char buf[8]{};
    std::snprintf(buf, sizeof(buf), ".%03lld", frac);
    std::string f(buf);
    while (f.back() == '0') f.pop_back();
    out += f;
  }
  return out + "s";
}

// ── Parsing ──────────────────────────────────────────────────────────────────

namespace {

// Reads typed members of one JSON object, naming the object in every error.
class Reader {
 public:
  Reader(const json& obj, std::string where) : obj_(obj), where_(std::move(where)) {
    if (!obj_.is_object()) throw ConfigError(where_ + ": expected an object");
  }

  const json* find(const char* key) const {
    auto it = obj_.find(key);
    if (it == obj_.end() || it->is_null()) return nullptr;
    return &*it;
  }

  std::string string(const char* key) const {
    const json* v = find(key);
    if (!v) return {};
    if (!v->is_string()) fail(key, "a string");
    return v->get<std::string>();
  }

  int integer(const char* key) const {
    const json* v = find(key);
    if (!v) return 0;
    if (!v->is_number_integer()) fail(key, "an integer");
    // Unsigned values above INT64_MAX would wrap through int64_t.
    const bool fits = v->is_number_unsigned()
                          ? v->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
                          : v->get<int64_t>() >= std::numeric_limits<int>::min() &&
                                v->get<int64_t>() <= std::numeric_limits<int>::max();
    if (!fits) fail(key, "an integer within the int range");
    return static_cast<int>(v->get<int64_t>());
  }

  bool boolean(const char* key) const {
    const json* v = find(key);
    if (!v) return false;
    if (!v->is_boolean()) fail(key, "a boolean");
    return v->get<bool>();
  }

  ArgumentList arguments(const char* key) const {
    const json* v = find(key);
    if (!v) return {};
    try {
      return arguments_from_json(*v);
    } catch (const CodecError& e) {
      throw ConfigError(where_ + ": '" + key + "': " + e.what());
    }
  }

  std::chrono::milliseconds duration(const char* key) const {
    const json* v = find(key);
    if (!v) return std::chrono::milliseconds(0);
    if (v->is_number_integer()) return std::chrono::milliseconds(v->get<long long>());
    if (!v->is_string()) fail(key, "a duration string or milliseconds");
    try {
      return parse_duration(v->get<std::string>());
    } catch (const ConfigError& e) {
      throw ConfigError(where_ + ": '" + key + "': " + e.what());
    }
  }

  const std::string& where() const {
    return where_;
  }

  [[noreturn]] void fail(const char* key, const char* expected) const {
    throw ConfigError(where_ + ": '" + key + "' must be " + expected);
  }

 private:
  const json& obj_;
  std::string where_;
};

CommandMapping parse_command(const json& j, const std::string& where) {
  Reader r(j, where);
  CommandMapping c;
  c.command = r.string("command");
  c.mqtt_topic = r.string("mqtt_topic");
  c.mqtt_sub_topic = r.string("mqtt_sub_topic");
  c.disallow_payload = r.boolean("disallow_payload");
  c.default_payload = r.arguments("default_payload");
  return c;
}

ScheduledPush parse_subscription(const json& j, const std::string& where) {
  Reader r(j, where);
  ScheduledPush s;
  s.command = r.string("command");
  s.payload = r.arguments("payload");
  s.interval = r.duration("interval");
  return s;
}

RelayConfig parse_relay(const json& j, size_t index) {
  Reader r(j, "relay " + std::to_string(index));
  RelayConfig c;
  c.mqtt_host = r.string("mqtt_host");
  c.mqtt_port = r.integer("mqtt_port");
  c.mqtt_client_id = r.string("mqtt_client_id");
  c.mqtt_user = r.string("mqtt_user");
  c.mqtt_password = r.string("mqtt_password");
  c.mqtt_topic = r.string("mqtt_topic");
  c.mqtt_disable_config_send = r.boolean("mqtt_disable_config_send");

  c.osc_host = r.string("osc_host");
  c.osc_port = r.integer("osc_port");
  c.osc_bind_addr = r.string("osc_bind_addr");
  c.osc_bind_port = r.integer("osc_bind_port");
  // The misspelling is the established key name; accept the corrected one too.
  c.osc_disallow_arbitrary_command = r.find("osc_disallow_arbritary_command")
                                         ? r.boolean("osc_disallow_arbritary_command")
                                         : r.boolean("osc_disallow_arbitrary_command");

  const char* commands_key = r.find("relay_commands") ? "relay_commands" : "commands";
  if (const json* list = r.find(commands_key)) {
    if (!list->is_array()) r.fail(commands_key, "an array");
    for (size_t i = 0; i < list->size(); ++i) {
      c.commands.push_back(
          parse_command((*list)[i], r.where() + " " + commands_key + "[" + std::to_string(i) + "]"));
    }
  }

  if (const json* list = r.find("osc_subscriptions")) {
    if (!list->is_array()) r.fail("osc_subscriptions", "an array");
    for (size_t i = 0; i < list->size(); ++i) {
      c.osc_subscriptions.push_back(parse_subscription(
          (*list)[i], r.where() + " osc_subscriptions[" + std::to_string(i) + "]"));
    }
  }

  const int level = r.integer("log_level");
  if (level < 0 || level > static_cast<int>(LogLevel::Debug)) {
    throw ConfigError(r.where() + ": 'log_level' must be between 0 and 3");
  }
  c.log_level = static_cast<LogLevel>(level);
  return c;
}

}  // namespace

std::vector<RelayConfig> parse_config(const json& doc) {
  if (!doc.is_object()) throw ConfigError("configuration must be a JSON object");
  auto relays = doc.find("relays");
  if (relays == doc.end() || relays->is_null()) return {};
  if (!relays->is_array()) throw ConfigError("'relays' must be an array");

  std::vector<RelayConfig> out;
  out.reserve(relays->size());
  for (size_t i = 0; i < relays->size(); ++i) out.push_back(parse_relay((*relays)[i], i));
  return out;
}

std::vector<RelayConfig> load_config_file(const std::string& path) {
  const auto ext = std::filesystem::path(path).extension();
  if (ext == ".yaml" || ext == ".yml") {
    throw ConfigError(path + " is YAML; the configuration is now JSON (see config.example.json)");
  }
  std::ifstream in(path);
  if (!in) throw ConfigError("cannot open configuration file " + path);
  try {
    return parse_config(json::parse(in));
  } catch (const json::exception& e) {
    throw ConfigError("error parsing " + path + ": " + e.what());
  }
}

// ── Status snapshot ──────────────────────────────────────────────────────────

json relay_to_json(const RelayConfig& config) {
  json commands = json::array();
  for (const auto& c : config.commands) {
    commands.push_back({{"command", c.command},
                        {"mqtt_topic", c.mqtt_topic},
                        {"mqtt_sub_topic", c.mqtt_sub_topic},
                        {"disallow_payload", c.disallow_payload},
                        {"default_payload", arguments_to_json(c.default_payload)}});
  }

  json subscriptions = json::array();
  for (const auto& s : config.osc_subscriptions) {
    subscriptions.push_back({{"command", s.command},
                             {"payload", arguments_to_json(s.payload)},
                             {"interval", format_duration(s.interval)}});
  }

  return {{"mqtt_host", config.mqtt_host},
          {"mqtt_port", config.mqtt_port},
          {"mqtt_client_id", config.mqtt_client_id},
          {"mqtt_user", config.mqtt_user},
          {"mqtt_topic", config.mqtt_topic},
          {"mqtt_disable_config_send", config.mqtt_disable_config_send},
          {"osc_host", config.osc_host},
          {"osc_port", config.osc_port},
          {"osc_bind_addr", config.osc_bind_addr},
          {"osc_bind_port", config.osc_bind_port},
          {"osc_disallow_arbritary_command", config.osc_disallow_arbitrary_command},
          {"commands", std::move(commands)},
          {"osc_subscriptions", std::move(subscriptions)},
          {"log_level", static_cast<int>(config.log_level)}};
}

}  // namespace oscbridge
