#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>

namespace conj_cache {

enum class LogLevel : std::uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

struct Logger {
  static inline LogLevel level = LogLevel::Warn;

  static bool enabled(LogLevel l) { return l >= level; }

  static void write(LogLevel l, const std::string &msg) {
    if (!enabled(l))
      return;
    const auto t =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    const char *tag = "?";
    switch (l) {
    case LogLevel::Debug:
      tag = "DEBUG";
      break;
    case LogLevel::Info:
      tag = "INFO";
      break;
    case LogLevel::Warn:
      tag = "WARN";
      break;
    case LogLevel::Error:
      tag = "ERROR";
      break;
    }
    std::fprintf(stderr, "[%02d:%02d:%02d] [%s] %s\n", tm.tm_hour, tm.tm_min,
                 tm.tm_sec, tag, msg.c_str());
  }
};

inline void set_log_level(LogLevel l) { Logger::level = l; }

inline std::optional<LogLevel> parse_log_level(const std::string &name) {
  if (name == "debug")
    return LogLevel::Debug;
  if (name == "info")
    return LogLevel::Info;
  if (name == "warn" || name == "warning")
    return LogLevel::Warn;
  if (name == "error")
    return LogLevel::Error;
  return std::nullopt;
}

} // namespace conj_cache

// The message expression is only evaluated when the level is enabled.
#define CONJ_LOG_DEBUG(msg)                                                    \
  do {                                                                         \
    if (::conj_cache::Logger::enabled(::conj_cache::LogLevel::Debug))          \
      ::conj_cache::Logger::write(::conj_cache::LogLevel::Debug, (msg));       \
  } while (0)
#define CONJ_LOG_INFO(msg)                                                     \
  do {                                                                         \
    if (::conj_cache::Logger::enabled(::conj_cache::LogLevel::Info))           \
      ::conj_cache::Logger::write(::conj_cache::LogLevel::Info, (msg));        \
  } while (0)
#define CONJ_LOG_WARN(msg)                                                     \
  do {                                                                         \
    if (::conj_cache::Logger::enabled(::conj_cache::LogLevel::Warn))           \
      ::conj_cache::Logger::write(::conj_cache::LogLevel::Warn, (msg));        \
  } while (0)
#define CONJ_LOG_ERROR(msg)                                                    \
  do {                                                                         \
    if (::conj_cache::Logger::enabled(::conj_cache::LogLevel::Error))          \
      ::conj_cache::Logger::write(::conj_cache::LogLevel::Error, (msg));       \
  } while (0)
