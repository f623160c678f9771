#pragma once

#include <format>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include "swarmcast/core/expected.hpp"

namespace swarmcast {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

using LogHook = std::function<void(LogLevel, std::string_view)>;

void set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;
bool log_enabled(LogLevel level) noexcept;

// Replaces the stderr writer; pass an empty hook to restore it.
void set_log_hook(LogHook hook);

const char* log_level_name(LogLevel level) noexcept;
Expected<LogLevel> parse_log_level(std::string_view s);

void log_line(LogLevel level, std::string_view message);

template <class... Args>
void log_debug(std::format_string<Args...> fmt, Args&&... args) {
  if (log_enabled(LogLevel::Debug)) {
    log_line(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...));
  }
}

template <class... Args>
void log_info(std::format_string<Args...> fmt, Args&&... args) {
  if (log_enabled(LogLevel::Info)) {
    log_line(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
  }
}

template <class... Args>
void log_warn(std::format_string<Args...> fmt, Args&&... args) {
  if (log_enabled(LogLevel::Warn)) {
    log_line(LogLevel::Warn, std::format(fmt, std::forward<Args>(args)...));
  }
}

template <class... Args>
void log_error(std::format_string<Args...> fmt, Args&&... args) {
  if (log_enabled(LogLevel::Error)) {
    log_line(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...));
  }
}

}  // namespace swarmcast
