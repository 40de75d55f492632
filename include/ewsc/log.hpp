/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for EWSC (loghelper-compatible interface).
 * Provides EWSC_LOG_DEBUG, EWSC_LOG_INFO, EWSC_LOG_WARN, EWSC_LOG_ERROR macros.
 */

#ifndef EWSC_LOG_HPP_
#define EWSC_LOG_HPP_

#include <atomic>
#include <iostream>
#include <string>

namespace ewsc {

// Simple logging implementation (will integrate loghelper later)
class Logger {
 public:
  enum class Level { kDebug, kInfo, kWarn, kError, kOff };

  // Messages below the threshold are dropped. Default: kWarn.
  static void set_level(Level level) { threshold().store(level, std::memory_order_relaxed); }

  static Level level() { return threshold().load(std::memory_order_relaxed); }

  static bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(Logger::level());
  }

  static void log(Level level, const std::string& msg) {
    if (!enabled(level)) return;
    const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]", ""};
    std::cerr << prefix[static_cast<int>(level)] << " [ewsc] " << msg << std::endl;
  }

 private:
  static std::atomic<Level>& threshold() {
    static std::atomic<Level> value{Level::kWarn};
    return value;
  }
};

#define EWSC_LOG_DEBUG(msg)                                       \
  do {                                                            \
    if (::ewsc::Logger::enabled(::ewsc::Logger::Level::kDebug))   \
      ::ewsc::Logger::log(::ewsc::Logger::Level::kDebug, msg);    \
  } while (0)
#define EWSC_LOG_INFO(msg) ::ewsc::Logger::log(::ewsc::Logger::Level::kInfo, msg)
#define EWSC_LOG_WARN(msg) ::ewsc::Logger::log(::ewsc::Logger::Level::kWarn, msg)
#define EWSC_LOG_ERROR(msg) ::ewsc::Logger::log(::ewsc::Logger::Level::kError, msg)

}  // namespace ewsc

#endif  // EWSC_LOG_HPP_
