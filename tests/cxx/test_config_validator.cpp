// Relay configuration checks run before any relay starts.

#include <gtest/gtest.h>

#include <string>

#include "config_validator.h"

using namespace oscbridge;

static RelayConfig make_relay(const std::string& topic, int bind_port) {
  RelayConfig r;
  r.mqtt_host = "localhost";
  r.mqtt_port = 1883;
  r.mqtt_topic = topic;
  r.osc_host = "127.0.0.1";
  r.osc_port = 10023;
  r.osc_bind_addr = "0.0.0.0";
  r.osc_bind_port = bind_port;
  return r;
}

// Run the validator and return the ConfigError text ("" when it passed).
static std::string rejection(std::vector<RelayConfig> relays) {
  try {
    validate_relays(std::move(relays));
  } catch (const ConfigError& e) {
    return e.what();
  }
  return {};
}

TEST(ConfigValidator, AcceptsDistinctRelays) {
  auto relays = validate_relays({make_relay("osc/a", 9000), make_relay("osc/b", 9001)});
  ASSERT_EQ(relays.size(), 2u);
  EXPECT_EQ(relays[1].mqtt_topic, "osc/b");
}

TEST(ConfigValidator, RejectsEmptyList) {
  EXPECT_THROW(validate_relays({}), ConfigError);
}

TEST(ConfigValidator, RejectsSharedTopic) {
  std::string err = rejection({make_relay("osc/a", 9000), make_relay("osc/a", 9001)});
  EXPECT_NE(err.find("relay 0"), std::string::npos) << err;
  EXPECT_NE(err.find("osc/a"), std::string::npos) << err;
}

TEST(ConfigValidator, RejectsSharedBindPort) {
  std::string err = rejection({make_relay("osc/a", 9000), make_relay("osc/b", 9000)});
  EXPECT_NE(err.find("9000"), std::string::npos) << err;
}

TEST(ConfigValidator, ClientOnlyRelaysMayShareNoPort) {
  RelayConfig a = make_relay("osc/a", 0);
  RelayConfig b = make_relay("osc/b", 0);
  a.osc_bind_addr.clear();
  b.osc_bind_addr.clear();
  EXPECT_NO_THROW(validate_relays({a, b}));
}

TEST(ConfigValidator, RejectsRelayWithoutEndpoint) {
  RelayConfig r = make_relay("osc/a", 0);
  r.osc_bind_addr.clear();
  r.osc_host.clear();
  r.osc_port = 0;
  std::string err = rejection({make_relay("osc/ok", 9000), r});
  EXPECT_NE(err.find("relay 1"), std::string::npos) << err;
}

TEST(ConfigValidator, RejectsMissingBroker) {
  RelayConfig r = make_relay("osc/a", 9000);
  r.mqtt_host.clear();
  EXPECT_THROW(validate_relays({r}), ConfigError);

  r = make_relay("osc/a", 9000);
  r.mqtt_port = 70000;
  EXPECT_THROW(validate_relays({r}), ConfigError);
}

TEST(ConfigValidator, RejectsMissingTopic) {
  EXPECT_THROW(validate_relays({make_relay("", 9000)}), ConfigError);
}

TEST(ConfigValidator, RejectsZeroInterval) {
  RelayConfig r = make_relay("osc/a", 9000);
  r.osc_subscriptions.push_back({"/xremote", {}, std::chrono::milliseconds(0)});
  std::string err = rejection({r});
  EXPECT_NE(err.find("interval"), std::string::npos) << err;
}

TEST(ConfigValidator, RejectsMappingWithoutTopic) {
  RelayConfig r = make_relay("osc/a", 9000);
  CommandMapping m;
  m.command = "/ch/01/mix/on";
  r.commands.push_back(m);
  EXPECT_THROW(validate_relays({r}), ConfigError);

  r.commands[0].mqtt_sub_topic = "ch1/on";
  EXPECT_NO_THROW(validate_relays({r}));
}

TEST(ConfigValidator, BindPortDefaultsToOscPort) {
  auto relays = validate_relays({make_relay("osc/a", 0)});
  EXPECT_EQ(relays[0].osc_bind_port, 10023);
  EXPECT_TRUE(relays[0].server_enabled());
  EXPECT_TRUE(relays[0].bidirectional());
}

TEST(ConfigValidator, DerivedBindPortsCollide) {
  // Both relays inherit osc_port 10023 as their bind port.
  std::string err = rejection({make_relay("osc/a", 0), make_relay("osc/b", 0)});
  EXPECT_NE(err.find("10023"), std::string::npos) << err;
}
