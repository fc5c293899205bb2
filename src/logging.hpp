#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <string>
#include <utility>

namespace logging {

// Logging verbosity levels
enum class LogLevel {
  TRACE,
  DEBUG,
  INFO,
  WARN,
  ERROR,
  CRITICAL,
  OFF,
  QUIET,
  NORMAL,
  VERBOSE
};

// Global verbosity level
inline LogLevel loggingLevel = LogLevel::INFO;
inline bool spdlogInitialized = false;

inline spdlog::level::level_enum toSpdlogLevel(LogLevel customLevel) {
    switch (customLevel) {
        case LogLevel::TRACE:   return spdlog::level::trace;
        case LogLevel::DEBUG:   return spdlog::level::debug;
        case LogLevel::INFO:    return spdlog::level::info;
        case LogLevel::WARN:    return spdlog::level::warn;
        case LogLevel::ERROR:   return spdlog::level::err;
        case LogLevel::CRITICAL:return spdlog::level::critical;
        case LogLevel::OFF:     return spdlog::level::off;
        case LogLevel::QUIET:   return spdlog::level::warn;
        case LogLevel::NORMAL:  return spdlog::level::info;
        case LogLevel::VERBOSE: return spdlog::level::debug;
        default:                return spdlog::level::info;
    }
}

// Initialize spdlog. Diagnostics go to stderr so query output on stdout stays clean.
inline void initSpdlog() {
    if (!spdlogInitialized) {
        spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");

        auto logger = spdlog::get("orthotree");
        if (!logger) {
            logger = spdlog::stderr_color_mt("orthotree");
        }
        spdlog::set_default_logger(logger);

        spdlog::set_level(toSpdlogLevel(loggingLevel));
        spdlogInitialized = true;
    }
}

inline void setLoggingLevel(LogLevel level) {
    loggingLevel = level;
    spdlog::set_level(toSpdlogLevel(level));
}

// Simple timer with concise output
class Timer {
public:
  explicit Timer(const std::string &name, LogLevel level = LogLevel::INFO)
      : name_(name), level_(level), start_(std::chrono::high_resolution_clock::now()) {}

  ~Timer() {
    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        end - start_);
    spdlog::log(toSpdlogLevel(level_), "{}: {} ms", name_, duration.count());
  }

private:
  std::string name_;
  LogLevel level_;
  std::chrono::time_point<std::chrono::high_resolution_clock> start_;
};

#define ORTHOTREE_CONCAT_INNER(a, b) a##b
#define ORTHOTREE_CONCAT(a, b) ORTHOTREE_CONCAT_INNER(a, b)
#define TIME_OPERATION(name) \
  logging::Timer ORTHOTREE_CONCAT(_timer_, __LINE__) { name }

// Debug log messages
template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
  spdlog::debug(fmt, std::forward<Args>(args)...);
}

inline void debug(const std::string& msg) {
  spdlog::debug(msg);
}

// Info log messages
template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
  spdlog::info(fmt, std::forward<Args>(args)...);
}

inline void info(const std::string& msg) {
  spdlog::info(msg);
}

// Warning log messages
template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
  spdlog::warn(fmt, std::forward<Args>(args)...);
}

inline void warn(const std::string& msg) {
  spdlog::warn(msg);
}

// Error log messages
template <typename... Args>
inline void err(fmt::format_string<Args...> fmt, Args&&... args) {
  spdlog::error(fmt, std::forward<Args>(args)...);
}

inline void err(const std::string& msg) {
  spdlog::error(msg);
}

} // namespace logging
