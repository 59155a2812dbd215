// MQTT topic -> OSC action routing, driven against an in-memory transport.

#include <gtest/gtest.h>

#include "fakes.h"
#include "json_codec.h"
#include "topic_router.h"

using namespace oscbridge;
using oscbridge::testing::FakeTransport;
using oscbridge::testing::LogCapture;

class TopicRouterTest : public ::testing::Test {
 protected:
  TopicRouterTest() {
    config_.mqtt_topic = "osc/test";
    config_.osc_host = "127.0.0.1";
    config_.osc_port = 10023;
  }

  void route(const std::string& topic, const std::string& payload) {
    TopicRouter router(config_, transport_, [this] { ++status_checks_; }, log_);
    router.route(topic, payload);
  }

  std::vector<std::string> errors() {
    logger_.drain();
    return capture_.errors();
  }

  ControlMessage only_message() {
    auto sent = transport_.sent();
    EXPECT_EQ(sent.size(), 1u);
    if (sent.size() != 1 || !std::holds_alternative<ControlMessage>(sent[0])) return {};
    return std::get<ControlMessage>(sent[0]);
  }

  CommandMapping mapping(const std::string& command, const std::string& topic,
                         const std::string& sub_topic) {
    CommandMapping m;
    m.command = command;
    m.mqtt_topic = topic;
    m.mqtt_sub_topic = sub_topic;
    return m;
  }

  RelayConfig config_;
  FakeTransport transport_;
  int status_checks_ = 0;
  LogCapture capture_;
  Logger logger_{capture_.sink()};
  ComponentLogger log_{logger_, "osc/test", LogLevel::Debug};
};

// ── Command mappings ─────────────────────────────────────────────────────────

TEST_F(TopicRouterTest, MappingTakesPrecedenceOverSend) {
  config_.commands.push_back(mapping("/mapped", "osc/test/send/foo", ""));

  route("osc/test/send/foo", "[1]");

  ControlMessage m = only_message();
  EXPECT_EQ(m.address, "/mapped");
  ASSERT_EQ(m.arguments.size(), 1u);
  EXPECT_EQ(std::get<int32_t>(m.arguments[0]), 1);
}

TEST_F(TopicRouterTest, MappingBySubTopic) {
  config_.commands.push_back(mapping("/ch/01/mix/on", "", "ch1/on"));

  route("osc/test/ch1/on", "[0]");

  ControlMessage m = only_message();
  EXPECT_EQ(m.address, "/ch/01/mix/on");
  EXPECT_EQ(std::get<int32_t>(m.arguments[0]), 0);
}

TEST_F(TopicRouterTest, DisallowedPayloadFallsBackToDefault) {
  CommandMapping m = mapping("/ch/01/mix/fader", "", "ch1/fader");
  m.disallow_payload = true;
  m.default_payload = {1.0f};
  config_.commands.push_back(m);

  route("osc/test/ch1/fader", "[5]");

  ControlMessage sent = only_message();
  ASSERT_EQ(sent.arguments.size(), 1u);
  EXPECT_FLOAT_EQ(std::get<float>(sent.arguments[0]), 1.0f);
}

TEST_F(TopicRouterTest, EmptyPayloadFallsBackToDefault) {
  CommandMapping m = mapping("/save", "studio/save", "");
  m.default_payload = {std::string("scene"), int32_t{3}};
  config_.commands.push_back(m);

  route("studio/save", "");

  EXPECT_EQ(only_message().arguments, m.default_payload);
}

TEST_F(TopicRouterTest, BadPayloadAbortsOnlyThatMapping) {
  CommandMapping forward = mapping("/forward", "", "shared");
  CommandMapping fixed = mapping("/fixed", "", "shared");
  fixed.disallow_payload = true;
  config_.commands = {forward, fixed};

  route("osc/test/shared", "not json");

  EXPECT_EQ(only_message().address, "/fixed");
  EXPECT_EQ(errors().size(), 1u);
}

TEST_F(TopicRouterTest, EveryMatchingMappingFires) {
  config_.commands = {mapping("/a", "", "both"), mapping("/b", "osc/test/both", "")};

  route("osc/test/both", "");

  auto sent = transport_.sent();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(std::get<ControlMessage>(sent[0]).address, "/a");
  EXPECT_EQ(std::get<ControlMessage>(sent[1]).address, "/b");
}

// ── Arbitrary commands ───────────────────────────────────────────────────────

TEST_F(TopicRouterTest, SendStripsNamespace) {
  route("osc/test/send/ch/01/mix/fader", "[0.75]");

  ControlMessage m = only_message();
  EXPECT_EQ(m.address, "/ch/01/mix/fader");
  ASSERT_EQ(m.arguments.size(), 1u);
  EXPECT_FLOAT_EQ(std::get<float>(m.arguments[0]), 0.75f);
}

TEST_F(TopicRouterTest, SendWithoutPathTargetsRoot) {
  route("osc/test/send", "");

  ControlMessage m = only_message();
  EXPECT_EQ(m.address, "/");
  EXPECT_TRUE(m.arguments.empty());
}

TEST_F(TopicRouterTest, SimilarPrefixIsNotSend) {
  route("osc/test/sender", "[1]");
  route("osc/other/send/x", "[1]");
  EXPECT_TRUE(transport_.sent().empty());
}

TEST_F(TopicRouterTest, ArbitraryCommandsCanBeDisabled) {
  config_.osc_disallow_arbitrary_command = true;

  route("osc/test/send/ch/01/mix/on", "[1]");
  route("osc/test/bundle/send", R"({"messages": [{"address": "/x"}]})");

  EXPECT_TRUE(transport_.sent().empty());
  auto errs = errors();
  ASSERT_EQ(errs.size(), 2u);
  EXPECT_NE(errs[0].find("Arbitrary commands are disabled"), std::string::npos);
}

TEST_F(TopicRouterTest, DisabledArbitraryStillAllowsMappings) {
  config_.osc_disallow_arbitrary_command = true;
  config_.commands.push_back(mapping("/ch/01/mix/on", "", "ch1/on"));

  route("osc/test/ch1/on", "[1]");

  EXPECT_EQ(only_message().address, "/ch/01/mix/on");
  EXPECT_TRUE(errors().empty());
}

TEST_F(TopicRouterTest, BadSendPayloadIsLogged) {
  route("osc/test/send/x", "[[1]]");
  EXPECT_TRUE(transport_.sent().empty());
  EXPECT_EQ(errors().size(), 1u);
}

// ── Bundles and status ───────────────────────────────────────────────────────

TEST_F(TopicRouterTest, BundleSend) {
  const std::string payload = R"({
    "timetag": "2024-03-01T12:30:45Z",
    "messages": [{"address": "/a", "arguments": [1]}, {"address": "/b"}],
    "bundles": [{"messages": [{"address": "/c", "arguments": ["x"]}]}]
  })";

  route("osc/test/bundle/send", payload);

  auto sent = transport_.sent();
  ASSERT_EQ(sent.size(), 1u);
  ASSERT_TRUE(std::holds_alternative<ControlBundle>(sent[0]));
  EXPECT_EQ(std::get<ControlBundle>(sent[0]), parse_bundle(payload));
}

TEST_F(TopicRouterTest, StatusCheckRequestsSnapshot) {
  route("osc/test/status/check", "");
  EXPECT_EQ(status_checks_, 1);
  EXPECT_TRUE(transport_.sent().empty());
}

TEST_F(TopicRouterTest, SendFailureIsLogged) {
  transport_.fail_sends = true;

  route("osc/test/send/x", "");

  auto errs = errors();
  ASSERT_EQ(errs.size(), 1u);
  EXPECT_EQ(errs[0].rfind("Send Error: ", 0), 0u);
}

TEST_F(TopicRouterTest, SubscriptionTopics) {
  config_.commands = {mapping("/a", "studio/a", "a/sub")};
  TopicRouter router(config_, transport_, nullptr, log_);

  EXPECT_EQ(router.subscriptions(),
            (std::vector<std::string>{"osc/test/send/#", "osc/test/bundle/send",
                                      "osc/test/status/check", "studio/a", "osc/test/a/sub"}));
}
