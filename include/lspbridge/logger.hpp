#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <format>
#include <mutex>
#include <print>
#include <source_location>
#include <string>
#include <string_view>

namespace lspbridge::logging {

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

inline std::string get_current_timestamp() {
  using namespace std::chrono;

  auto now = system_clock::now();
  auto ymd = year_month_day{floor<days>(now)};
  auto hms = hh_mm_ss{floor<milliseconds>(now - floor<days>(now))};

  return std::format("{} {}", ymd, hms);
}

}  // namespace lspbridge::logging

namespace lspbridge {

// Explicitly constructed and handed to every component that logs.  The read
// loop, the stderr pump and callers may log at the same time, so each line
// is written under a lock.
class logger {
 public:
  explicit logger(
      logging::level lvl = logging::level::info, std::FILE* sink = stderr)
      : lvl{lvl}, sink{sink} {}

  logger(const logger&) = delete;
  logger& operator=(const logger&) = delete;

  void set_level(logging::level l) {
    std::scoped_lock lk{mtx};
    lvl = l;
  }

  bool enabled(logging::level l) {
    std::scoped_lock lk{mtx};
    return l <= lvl;
  }

  template <typename... Args>
  void log(
      logging::level level, const std::source_location& location,
      std::format_string<Args...> fmt, Args&&... args) {
    if (!enabled(level)) return;

    auto line = std::format(
        "{} {}:{} {}: {}", logging::get_current_timestamp(),
        std::filesystem::path{location.file_name()}.filename().c_str(),
        location.line(), logging::level_to_string(level),
        std::format(fmt, std::forward<Args>(args)...));

    std::scoped_lock lk{mtx};
    std::println(sink, "{}", line);
    std::fflush(sink);
  }

 private:
  std::mutex mtx;
  logging::level lvl;
  std::FILE* sink;
};

}  // namespace lspbridge

// NOLINTBEGIN
#define LOG_TRACE(lg, ...)                                             \
  (lg).log(                                                            \
      lspbridge::logging::level::trace, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_DEBUG(lg, ...)                                             \
  (lg).log(                                                            \
      lspbridge::logging::level::debug, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_INFO(lg, ...)                                             \
  (lg).log(                                                           \
      lspbridge::logging::level::info, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_WARN(lg, ...)                                                \
  (lg).log(                                                              \
      lspbridge::logging::level::warning, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_ERROR(lg, ...)                                             \
  (lg).log(                                                            \
      lspbridge::logging::level::error, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_FATAL(lg, ...)                                             \
  (lg).log(                                                            \
      lspbridge::logging::level::fatal, std::source_location::current(), \
      __VA_ARGS__)
// NOLINTEND
