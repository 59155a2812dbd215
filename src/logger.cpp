// logger.cpp

#include "logger.h"

#include <ctime>
#include <utility>

namespace oscbridge {

static Logger::Sink make_file_sink(std::FILE* out) {
  return [out](const LogRecord& r) {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    ::localtime_r(&now, &tm);
    char stamp[32]{};
    std::strftime(stamp, sizeof(stamp), "%Y/%m/%d %H:%M:%S", &tm);
    std::fprintf(out, "%s [%s][%s] %s\n", stamp, to_string(r.level), r.component.c_str(),
                 r.text.c_str());
    std::fflush(out);
  };
}

Logger::Logger(std::FILE* out) : Logger(make_file_sink(out)) {
}

Logger::Logger(Sink sink) : sink_(std::move(sink)) {
  thread_ = std::thread([this] { run(); });
}

Logger::~Logger() {
  {
    std::lock_guard lk(mu_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void Logger::write(LogLevel level, std::string component, std::string text) {
  {
    std::lock_guard lk(mu_);
    queue_.push(LogRecord{level, std::move(component), std::move(text)});
  }
  cv_.notify_one();
}

void Logger::drain() {
  std::unique_lock lk(mu_);
  idle_cv_.wait(lk, [this] { return queue_.empty() && !busy_; });
}

void Logger::run() {
  std::unique_lock lk(mu_);
  while (true) {
    cv_.wait(lk, [this] { return !queue_.empty() || !running_; });
    // Flush what is queued before honouring shutdown.
    while (!queue_.empty()) {
      LogRecord r = std::move(queue_.front());
      queue_.pop();
      busy_ = true;
      lk.unlock();

      sink_(r);

      lk.lock();
      busy_ = false;
    }
    idle_cv_.notify_all();
    if (!running_) break;
  }
}

}  // namespace oscbridge
