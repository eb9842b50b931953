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

namespace kaiak::logger {

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
  auto now = floor<milliseconds>(system_clock::now());
  return fmt::format("{:%Y-%m-%d %H:%M:%S}", now);
}

// Everything goes to stderr: stdout is the wire in stdio mode.
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

}  // namespace kaiak::logger

// NOLINTBEGIN
#define LOG_TRACE(...)                                             \
  kaiak::logger::log(                                              \
      kaiak::logger::level::trace, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_DEBUG(...)                                             \
  kaiak::logger::log(                                              \
      kaiak::logger::level::debug, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_INFO(...) \
  kaiak::logger::log( \
      kaiak::logger::level::info, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...)                                                \
  kaiak::logger::log(                                                \
      kaiak::logger::level::warning, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_ERROR(...)                                             \
  kaiak::logger::log(                                              \
      kaiak::logger::level::error, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_FATAL(...)                                             \
  kaiak::logger::log(                                              \
      kaiak::logger::level::fatal, std::source_location::current(), \
      __VA_ARGS__)
// NOLINTEND
