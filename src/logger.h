#pragma once
// logger.h: Process-wide asynchronous log sink.
//
// Components never print directly: they format a record through their
// ComponentLogger and push it here. A dedicated thread writes the records,
// so a slow terminal never stalls a UDP receive loop or a broker callback.

#include <condition_variable>
#include <cstdio>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "oscbridge/relay_config.hpp"

namespace oscbridge {

struct LogRecord {
  LogLevel level;
  std::string component;
  std::string text;
};

class Logger {
 public:
  using Sink = std::function<void(const LogRecord&)>;

  // Writes "YYYY/MM/DD HH:MM:SS [LEVEL][component] text" lines to `out`.
  explicit Logger(std::FILE* out = stdout);
  // Hands every record to `sink` on the logger thread.
  explicit Logger(Sink sink);
  ~Logger();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void write(LogLevel level, std::string component, std::string text);

  // Block until every record written so far has reached the sink.
  void drain();

 private:
  Sink sink_;
  std::queue<LogRecord> queue_;
  std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  bool running_{true};
  bool busy_{false};
  std::thread thread_;

  void run();
};

}  // namespace oscbridge
