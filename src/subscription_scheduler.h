#pragma once
// subscription_scheduler.h: Re-sends fixed OSC messages on an interval.
//
// One thread per ScheduledPush. The first send happens one interval after
// start(); stop() wakes every thread immediately regardless of cadence.

#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

#include "component_logger.h"
#include "osc_transport.h"
#include "oscbridge/relay_config.hpp"

namespace oscbridge {

class SubscriptionScheduler {
 public:
  SubscriptionScheduler(std::vector<ScheduledPush> pushes, OscTransport& transport,
                        const ComponentLogger& logger);
  ~SubscriptionScheduler();

  SubscriptionScheduler(const SubscriptionScheduler&) = delete;
  SubscriptionScheduler& operator=(const SubscriptionScheduler&) = delete;

  void start();
  void stop();

 private:
  std::vector<ScheduledPush> pushes_;
  OscTransport& transport_;
  const ComponentLogger& logger_;

  std::mutex mu_;
  std::condition_variable cv_;
  bool running_{false};
  std::vector<std::thread> threads_;

  void run(const ScheduledPush& push);
};

}  // namespace oscbridge
