#pragma once

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>

namespace cbridge::logger {

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

// stdout belongs to the stdio transport, so log lines go to stderr unless a
// log file was configured.
inline std::FILE* global_sink = nullptr;  // NOLINT
inline std::mutex sink_mutex;             // NOLINT

inline bool set_log_file(const std::filesystem::path& path) {
  std::FILE* f = std::fopen(path.c_str(), "a");
  if (!f) return false;
  std::lock_guard<std::mutex> lock{sink_mutex};
  if (global_sink) std::fclose(global_sink);
  global_sink = f;
  return true;
}

inline std::string get_current_timestamp() {
  using namespace std::chrono;

  auto now = system_clock::now();
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
  std::time_t t = system_clock::to_time_t(now);
  std::tm tm{};
  ::gmtime_r(&t, &tm);
  return fmt::format(
      "{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}", tm.tm_year + 1900,
      tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, ms.count());
}

// Core logging function
template <typename... Args>
inline void log(
    level level, const std::source_location& location,
    fmt::format_string<Args...> fmt, Args&&... args) {
  if (level > global_level) return;

  auto line = fmt::format(
      "{} {}:{} {}: {}\n", get_current_timestamp(),
      std::filesystem::path{location.file_name()}.filename().c_str(),
      location.line(), level_to_string(level),
      fmt::format(fmt, std::forward<Args>(args)...));

  std::lock_guard<std::mutex> lock{sink_mutex};
  std::FILE* out = global_sink ? global_sink : stderr;
  std::fputs(line.c_str(), out);
  std::fflush(out);
}

}  // namespace cbridge::logger

// NOLINTBEGIN
#define LOG_TRACE(...)                                                \
  cbridge::logger::log(                                               \
      cbridge::logger::level::trace, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_DEBUG(...)                                                \
  cbridge::logger::log(                                               \
      cbridge::logger::level::debug, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_INFO(...)                                                \
  cbridge::logger::log(                                              \
      cbridge::logger::level::info, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_WARN(...)                                                   \
  cbridge::logger::log(                                                 \
      cbridge::logger::level::warning, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_ERROR(...)                                                \
  cbridge::logger::log(                                               \
      cbridge::logger::level::error, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_FATAL(...)                                                \
  cbridge::logger::log(                                               \
      cbridge::logger::level::fatal, std::source_location::current(), \
      __VA_ARGS__)
// NOLINTEND
