/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for ctlapi (loghelper-compatible interface).
 * Provides CTLAPI_LOG_DEBUG, CTLAPI_LOG_INFO, CTLAPI_LOG_WARN,
 * CTLAPI_LOG_ERROR macros.
 */

#ifndef CTLAPI_LOG_HPP_
#define CTLAPI_LOG_HPP_

#include <iostream>
#include <string>

namespace ctlapi {

class Logger {
 public:
  // Ordered by severity; messages below the threshold are dropped.
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

  static void set_level(Level level) { threshold() = level; }
  static Level level() { return threshold(); }

  static bool enabled(Level level) { return static_cast<int>(level) >= static_cast<int>(threshold()); }

  static void log(Level level, const std::string& msg) {
    if (!enabled(level))
      return;
    const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};
    std::cerr << prefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

  // Accepts "debug", "info", "warn"/"warning" and "error"; anything else
  // maps to info.
  static Level parse_level(const std::string& name) {
    if (name == "debug")
      return Level::kDebug;
    if (name == "warn" || name == "warning")
      return Level::kWarn;
    if (name == "error")
      return Level::kError;
    return Level::kInfo;
  }

 private:
  static Level& threshold() {
    static Level level = Level::kInfo;
    return level;
  }
};

#define CTLAPI_LOG_INFO(msg) ::ctlapi::Logger::log(::ctlapi::Logger::Level::kInfo, msg)
#define CTLAPI_LOG_WARN(msg) ::ctlapi::Logger::log(::ctlapi::Logger::Level::kWarn, msg)
#define CTLAPI_LOG_ERROR(msg) ::ctlapi::Logger::log(::ctlapi::Logger::Level::kError, msg)
#define CTLAPI_LOG_DEBUG(msg)                                           \
  do {                                                                  \
    if (::ctlapi::Logger::enabled(::ctlapi::Logger::Level::kDebug))     \
      ::ctlapi::Logger::log(::ctlapi::Logger::Level::kDebug, msg);      \
  } while (0)

}  // namespace ctlapi

#endif  // CTLAPI_LOG_HPP_
