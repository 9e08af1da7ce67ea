#pragma once

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <source_location>
#include <string>
#include <string_view>

namespace wsplex::logger {

enum class level : uint8_t { fatal, error, warning, info, debug, trace };

inline std::string_view level_to_string(level level) {
  // clang-format off
  switch (level) {
  case level::trace:   return "TRACE";
  case level::debug:   return "DEBUG";
  case level::info:    return "INFO";
  case level::warning: return "WARNING";
  case level::error:   return "ERROR";
  case level::fatal:   return "FATAL";
  default: return "UNKNOWN";
  }
  // clang-format on
}

inline level global_level = level::info;  // NOLINT
inline void set_level(level level) { global_level = level; }

inline std::string get_current_timestamp() {
  using namespace std::chrono;

  auto now = system_clock::now();
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

  return fmt::format(
      "{:%F %T}.{:03}", fmt::gmtime(system_clock::to_time_t(now)), ms.count());
}

// Core logging function.  Always writes to stderr: stdout may be carrying
// the JSONRPC stream.
template <typename... Args>
inline void log(
    level level, const std::source_location& location,
    fmt::format_string<Args...> fmt, Args&&... args) {
  if (level > global_level) return;

  fmt::print(
      stderr, "{} {}:{} {}: {}\n", get_current_timestamp(),
      std::filesystem::path{location.file_name()}.filename().string(),
      location.line(), level_to_string(level),
      fmt::format(fmt, std::forward<Args>(args)...));
}

}  // namespace wsplex::logger

// NOLINTBEGIN
#define LOG_TRACE(...)                                               \
  wsplex::logger::log(                                               \
      wsplex::logger::level::trace, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_DEBUG(...)                                               \
  wsplex::logger::log(                                               \
      wsplex::logger::level::debug, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_INFO(...)                                               \
  wsplex::logger::log(                                              \
      wsplex::logger::level::info, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_WARN(...)                                                  \
  wsplex::logger::log(                                                 \
      wsplex::logger::level::warning, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_ERROR(...)                                               \
  wsplex::logger::log(                                               \
      wsplex::logger::level::error, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_FATAL(...)                                               \
  wsplex::logger::log(                                               \
      wsplex::logger::level::fatal, std::source_location::current(), \
      __VA_ARGS__)
// NOLINTEND
