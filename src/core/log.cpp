#include "microbench/core/log.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace microbench {
namespace {

LogLevel initial_level() {
  LogLevel level = LogLevel::Warn;
  if (const char* env = std::getenv("MICROBENCH_LOG"); env != nullptr && env[0] != '\0') {
    LogLevel parsed{};
    if (parse_log_level(env, parsed)) {
      level = parsed;
    }
  }
  return level;
}

std::atomic<int>& level_slot() {
  static std::atomic<int> slot{static_cast<int>(initial_level())};
  return slot;
}

const char* level_tag(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warn:
      return "warn";
    case LogLevel::Off:
      return "off";
  }
  return "log";
}

std::mutex& stderr_mutex() {
  static std::mutex mu;
  return mu;
}

}  // namespace

LogLevel log_level() noexcept {
  return static_cast<LogLevel>(level_slot().load(std::memory_order_relaxed));
}

void set_log_level(LogLevel level) noexcept {
  level_slot().store(static_cast<int>(level), std::memory_order_relaxed);
}

bool parse_log_level(std::string_view text, LogLevel& out) noexcept {
  if (text == "debug") {
    out = LogLevel::Debug;
  } else if (text == "info") {
    out = LogLevel::Info;
  } else if (text == "warn") {
    out = LogLevel::Warn;
  } else if (text == "off") {
    out = LogLevel::Off;
  } else {
    return false;
  }
  return true;
}

void log(LogLevel level, std::string_view message) {
  if (level == LogLevel::Off || static_cast<int>(level) < static_cast<int>(log_level())) {
    return;
  }
  std::scoped_lock lock(stderr_mutex());
  std::cerr << "[" << level_tag(level) << "] " << message << "\n";
}

}  // namespace microbench
