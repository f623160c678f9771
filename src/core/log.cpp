#include "swarmcast/core/log.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>

namespace swarmcast {
namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

std::mutex& log_mutex() {
  static std::mutex mu;
  return mu;
}

LogHook& log_hook() {
  static LogHook hook;
  return hook;
}

}  // namespace

void set_log_level(LogLevel level) noexcept {
  g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool log_enabled(LogLevel level) noexcept {
  return static_cast<int>(level) >= g_level.load(std::memory_order_relaxed);
}

void set_log_hook(LogHook hook) {
  std::scoped_lock lock(log_mutex());
  log_hook() = std::move(hook);
}

const char* log_level_name(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warn:
      return "warn";
    case LogLevel::Error:
      return "error";
  }
  return "info";
}

Expected<LogLevel> parse_log_level(std::string_view s) {
  if (s == "debug") {
    return LogLevel::Debug;
  }
  if (s == "info") {
    return LogLevel::Info;
  }
  if (s == "warn" || s == "warning") {
    return LogLevel::Warn;
  }
  if (s == "error") {
    return LogLevel::Error;
  }
  return unexpected<Error>(Error{ErrorCode::InvalidArgument,
                          std::format("invalid log level: {}", s)});
}

void log_line(LogLevel level, std::string_view message) {
  std::scoped_lock lock(log_mutex());
  if (log_hook()) {
    log_hook()(level, message);
    return;
  }
  const auto now = std::chrono::floor<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
  std::cerr << std::format("{:%FT%T}Z [{}] {}\n", now, log_level_name(level),
                           message);
}

}  // namespace swarmcast
