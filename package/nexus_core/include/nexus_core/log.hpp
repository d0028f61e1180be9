#pragma once

#include <cstdio>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace nexus_core {

enum class LogLevel { Debug = 0, Info, Warn, Error, Off };

inline const char *to_string(LogLevel l) {
  switch (l) {
  case LogLevel::Debug: return "Debug";
  case LogLevel::Info: return "Info";
  case LogLevel::Warn: return "Warn";
  case LogLevel::Error: return "Error";
  case LogLevel::Off: return "Off";
  }
  return "?";
}

// Process-wide floor. Debug lines are additionally gated per Logger.
inline LogLevel &global_log_level() {
  static LogLevel level = LogLevel::Info;
  return level;
}

// Tagged stderr logger: "[Warn] [builder] message".
class Logger {
public:
  explicit Logger(std::string_view component, bool debug = false)
      : component_(component), debug_(debug) {}

  void set_debug(bool debug) { debug_ = debug; }
  bool debug_enabled() const { return debug_; }

  template <typename... Args>
  void debug(fmt::format_string<Args...> f, Args &&...args) const {
    if (!debug_)
      return;
    write(LogLevel::Debug, fmt::format(f, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void info(fmt::format_string<Args...> f, Args &&...args) const {
    write(LogLevel::Info, fmt::format(f, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void warn(fmt::format_string<Args...> f, Args &&...args) const {
    write(LogLevel::Warn, fmt::format(f, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> f, Args &&...args) const {
    write(LogLevel::Error, fmt::format(f, std::forward<Args>(args)...));
  }

private:
  void write(LogLevel level, const std::string &msg) const {
    if (level != LogLevel::Debug && level < global_log_level())
      return;
    fmt::print(stderr, "[{}] [{}] {}\n", to_string(level), component_, msg);
  }

  std::string_view component_;
  bool debug_{false};
};

} // namespace nexus_core
