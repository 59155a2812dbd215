// subscription_scheduler.cpp

#include "subscription_scheduler.h"

#include <chrono>
#include <utility>

#include "bundle_codec.h"

namespace oscbridge {

SubscriptionScheduler::SubscriptionScheduler(std::vector<ScheduledPush> pushes,
                                             OscTransport& transport,
                                             const ComponentLogger& logger)
    : pushes_(std::move(pushes)), transport_(transport), logger_(logger) {
}

SubscriptionScheduler::~SubscriptionScheduler() {
  stop();
}

void SubscriptionScheduler::start() {
  {
    std::lock_guard lk{mu_};
    if (running_) return;
    running_ = true;
  }
  for (const auto& push : pushes_) {
    threads_.emplace_back(&SubscriptionScheduler::run, this, std::cref(push));
  }
}

void SubscriptionScheduler::stop() {
  {
    std::lock_guard lk{mu_};
    running_ = false;
  }
  cv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
}

void SubscriptionScheduler::run(const ScheduledPush& push) {
  const ControlMessage message{push.command, push.payload};
  auto next = std::chrono::steady_clock::now() + push.interval;

  while (true) {
    {
      std::unique_lock lk{mu_};
      cv_.wait_until(lk, next, [this] { return !running_; });
      if (!running_) break;
    }

    logger_.debug("Subscription tick %s", push.command.c_str());
    try {
      transport_.send(message);
    } catch (const TransportError& e) {
      logger_.error("Subscription %s: %s", push.command.c_str(), e.what());
    } catch (const CodecError& e) {
      logger_.error("Subscription %s: %s", push.command.c_str(), e.what());
    }
    next += push.interval;
  }
}

}  // namespace oscbridge
