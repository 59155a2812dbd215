#include "component_logger.h"

#include <cstdio>

namespace oscbridge {

void ComponentLogger::log_valist(LogLevel level, const char* fmt, va_list args) const {
  if (!enabled(level)) return;

  va_list probe;
  va_copy(probe, args);
  int n = std::vsnprintf(nullptr, 0, fmt, probe);
  va_end(probe);
  if (n < 0) return;

  std::string text(static_cast<size_t>(n), '\0');
  std::vsnprintf(text.data(), text.size() + 1, fmt, args);
  sink_.write(level, component_, std::move(text));
}

void ComponentLogger::error(const char* fmt, ...) const {
  va_list args;
  va_start(args, fmt);
  log_valist(LogLevel::Error, fmt, args);
  va_end(args);
}

void ComponentLogger::receive(const char* fmt, ...) const {
  va_list args;
  va_start(args, fmt);
  log_valist(LogLevel::Receive, fmt, args);
  va_end(args);
}

void ComponentLogger::send(const char* fmt, ...) const {
  va_list args;
  va_start(args, fmt);
  log_valist(LogLevel::Send, fmt, args);
  va_end(args);
}

void ComponentLogger::debug(const char* fmt, ...) const {
  va_list args;
  va_start(args, fmt);
  log_valist(LogLevel::Debug, fmt, args);
  va_end(args);
}

}  // namespace oscbridge
