/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for relay.
 * Provides RELAY_LOG_DEBUG, RELAY_LOG_INFO, RELAY_LOG_WARN, RELAY_LOG_ERROR macros.
 */

#ifndef RELAY_LOG_HPP_
#define RELAY_LOG_HPP_

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>

namespace relay {

class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

  static void log(Level level, const std::string& msg) {
    if (!enabled(level))
      return;
    const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};

    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    char stamp[32];
    size_t n = std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm_utc);
    std::snprintf(stamp + n, sizeof(stamp) - n, ".%03dZ", static_cast<int>(ms));

    std::lock_guard<std::mutex> lock(mutex());
    std::cerr << "[" << stamp << "] " << prefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

  static bool enabled(Level level) {
    return static_cast<int>(level) >= threshold().load(std::memory_order_relaxed);
  }

  static void set_level(Level level) { threshold().store(static_cast<int>(level), std::memory_order_relaxed); }

  // Debug mode lowers the threshold to kDebug; otherwise kInfo.
  static void set_debug(bool on) { set_level(on ? Level::kDebug : Level::kInfo); }

 private:
  static std::atomic<int>& threshold() {
    static std::atomic<int> level{static_cast<int>(Level::kInfo)};
    return level;
  }

  static std::mutex& mutex() {
    static std::mutex m;
    return m;
  }
};

#define RELAY_LOG_INFO(msg) ::relay::Logger::log(::relay::Logger::Level::kInfo, msg)
#define RELAY_LOG_WARN(msg) ::relay::Logger::log(::relay::Logger::Level::kWarn, msg)
#define RELAY_LOG_ERROR(msg) ::relay::Logger::log(::relay::Logger::Level::kError, msg)
#define RELAY_LOG_DEBUG(msg)                                        \
  do {                                                              \
    if (::relay::Logger::enabled(::relay::Logger::Level::kDebug))   \
      ::relay::Logger::log(::relay::Logger::Level::kDebug, msg);    \
  } while (0)

}  // namespace relay

#endif  // RELAY_LOG_HPP_
