#pragma once

#include <cstdarg>
#include <string>
#include <utility>

#include "logger.h"

namespace oscbridge {

// printf-style front end to the Logger, tagged with a component name and
// filtered by that component's verbosity threshold.
class ComponentLogger {
 public:
  ComponentLogger(Logger& sink, std::string component, LogLevel threshold)
      : sink_(sink), component_(std::move(component)), threshold_(threshold) {
  }

  bool enabled(LogLevel level) const {
    return level <= threshold_;
  }

  void error(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));
  void receive(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));
  void send(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));
  void debug(const char* fmt, ...) const __attribute__((format(printf, 2, 3)));

 private:
  Logger& sink_;
  std::string component_;
  LogLevel threshold_;

  void log_valist(LogLevel level, const char* fmt, va_list args) const;
};

}  // namespace oscbridge
