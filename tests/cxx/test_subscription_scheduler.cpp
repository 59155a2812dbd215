// Periodic OSC pushes.

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "fakes.h"
#include "subscription_scheduler.h"

using namespace oscbridge;
using namespace std::chrono_literals;
using oscbridge::testing::FakeTransport;
using oscbridge::testing::LogCapture;

class SchedulerTest : public ::testing::Test {
 protected:
  FakeTransport transport_;
  LogCapture capture_;
  Logger logger_{capture_.sink()};
  ComponentLogger log_{logger_, "osc/test", LogLevel::Debug};
};

TEST_F(SchedulerTest, SendsEveryInterval) {
  SubscriptionScheduler scheduler(
      {{"/xremote", {}, 20ms}, {"/meters", {std::string("/meters/1")}, 20ms}}, transport_, log_);
  scheduler.start();
  ASSERT_TRUE(transport_.wait_for_attempts(6, 2s));
  scheduler.stop();

  int xremote = 0, meters = 0;
  for (const auto& packet : transport_.sent()) {
    const auto& m = std::get<ControlMessage>(packet);
    if (m.address == "/xremote") {
      ++xremote;
      EXPECT_TRUE(m.arguments.empty());
    } else if (m.address == "/meters") {
      ++meters;
      EXPECT_EQ(std::get<std::string>(m.arguments[0]), "/meters/1");
    }
  }
  EXPECT_GE(xremote, 1);
  EXPECT_GE(meters, 1);
}

TEST_F(SchedulerTest, FirstSendWaitsOneInterval) {
  SubscriptionScheduler scheduler({{"/xremote", {}, 10s}}, transport_, log_);
  auto begin = std::chrono::steady_clock::now();
  scheduler.start();
  std::this_thread::sleep_for(50ms);
  scheduler.stop();

  EXPECT_TRUE(transport_.sent().empty());
  // stop() must not wait out the interval.
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
}

TEST_F(SchedulerTest, FailureDoesNotStopTimer) {
  transport_.fail_sends = true;
  SubscriptionScheduler scheduler({{"/xremote", {}, 10ms}}, transport_, log_);
  scheduler.start();
  EXPECT_TRUE(transport_.wait_for_attempts(3, 2s));
  scheduler.stop();

  logger_.drain();
  EXPECT_GE(capture_.errors().size(), 3u);
}

TEST_F(SchedulerTest, NoPushesIsHarmless) {
  SubscriptionScheduler scheduler({}, transport_, log_);
  scheduler.start();
  scheduler.stop();
  scheduler.stop();
  EXPECT_TRUE(transport_.sent().empty());
}
