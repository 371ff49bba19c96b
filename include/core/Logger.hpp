/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace CityScale {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release, written to file)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("CityScale - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define CITYSCALE_CRITICAL(system, msg)                                        \
  CityScale::Logger::Log(CityScale::LogLevel::CRITICAL, system, msg)
#define CITYSCALE_ERROR(system, msg)                                           \
  CityScale::Logger::Log(CityScale::LogLevel::ERROR_LEVEL, system, msg)
#define CITYSCALE_WARN(system, msg)                                            \
  CityScale::Logger::Log(CityScale::LogLevel::WARNING, system, msg)
#define CITYSCALE_INFO(system, msg)                                            \
  CityScale::Logger::Log(CityScale::LogLevel::INFO, system, msg)
#define CITYSCALE_DEBUG(system, msg)                                           \
  CityScale::Logger::Log(CityScale::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL and ERROR go to a log file, the rest compile out
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex;

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  // Defined in Logger.cpp
  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define CITYSCALE_CRITICAL(system, msg)                                        \
  CityScale::Logger::Log("CRITICAL", system, msg)

#define CITYSCALE_ERROR(system, msg)                                           \
  CityScale::Logger::Log("ERROR", system, msg)

#define CITYSCALE_WARN(system, msg) ((void)0)  // Zero overhead
#define CITYSCALE_INFO(system, msg) ((void)0)  // Zero overhead
#define CITYSCALE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros per subsystem

#define TILESTORE_CRITICAL(msg) CITYSCALE_CRITICAL("TileStore", msg)
#define TILESTORE_ERROR(msg) CITYSCALE_ERROR("TileStore", msg)
#define TILESTORE_WARN(msg) CITYSCALE_WARN("TileStore", msg)
#define TILESTORE_INFO(msg) CITYSCALE_INFO("TileStore", msg)
#define TILESTORE_DEBUG(msg) CITYSCALE_DEBUG("TileStore", msg)

#define SERIAL_CRITICAL(msg) CITYSCALE_CRITICAL("Serializer", msg)
#define SERIAL_ERROR(msg) CITYSCALE_ERROR("Serializer", msg)
#define SERIAL_WARN(msg) CITYSCALE_WARN("Serializer", msg)
#define SERIAL_INFO(msg) CITYSCALE_INFO("Serializer", msg)
#define SERIAL_DEBUG(msg) CITYSCALE_DEBUG("Serializer", msg)

#define REGISTRY_CRITICAL(msg) CITYSCALE_CRITICAL("CityRegistry", msg)
#define REGISTRY_ERROR(msg) CITYSCALE_ERROR("CityRegistry", msg)
#define REGISTRY_WARN(msg) CITYSCALE_WARN("CityRegistry", msg)
#define REGISTRY_INFO(msg) CITYSCALE_INFO("CityRegistry", msg)
#define REGISTRY_DEBUG(msg) CITYSCALE_DEBUG("CityRegistry", msg)

#define SPATIAL_CRITICAL(msg) CITYSCALE_CRITICAL("SpatialIndex", msg)
#define SPATIAL_ERROR(msg) CITYSCALE_ERROR("SpatialIndex", msg)
#define SPATIAL_WARN(msg) CITYSCALE_WARN("SpatialIndex", msg)
#define SPATIAL_INFO(msg) CITYSCALE_INFO("SpatialIndex", msg)
#define SPATIAL_DEBUG(msg) CITYSCALE_DEBUG("SpatialIndex", msg)

#define PATHFIND_CRITICAL(msg) CITYSCALE_CRITICAL("Pathfinding", msg)
#define PATHFIND_ERROR(msg) CITYSCALE_ERROR("Pathfinding", msg)
#define PATHFIND_WARN(msg) CITYSCALE_WARN("Pathfinding", msg)
#define PATHFIND_INFO(msg) CITYSCALE_INFO("Pathfinding", msg)
#define PATHFIND_DEBUG(msg) CITYSCALE_DEBUG("Pathfinding", msg)

#define ZONE_CRITICAL(msg) CITYSCALE_CRITICAL("ZoneClassifier", msg)
#define ZONE_ERROR(msg) CITYSCALE_ERROR("ZoneClassifier", msg)
#define ZONE_WARN(msg) CITYSCALE_WARN("ZoneClassifier", msg)
#define ZONE_INFO(msg) CITYSCALE_INFO("ZoneClassifier", msg)
#define ZONE_DEBUG(msg) CITYSCALE_DEBUG("ZoneClassifier", msg)

#define AGGREGATE_CRITICAL(msg) CITYSCALE_CRITICAL("DistrictAggregate", msg)
#define AGGREGATE_ERROR(msg) CITYSCALE_ERROR("DistrictAggregate", msg)
#define AGGREGATE_WARN(msg) CITYSCALE_WARN("DistrictAggregate", msg)
#define AGGREGATE_INFO(msg) CITYSCALE_INFO("DistrictAggregate", msg)
#define AGGREGATE_DEBUG(msg) CITYSCALE_DEBUG("DistrictAggregate", msg)

#define HYDRATION_CRITICAL(msg) CITYSCALE_CRITICAL("Hydration", msg)
#define HYDRATION_ERROR(msg) CITYSCALE_ERROR("Hydration", msg)
#define HYDRATION_WARN(msg) CITYSCALE_WARN("Hydration", msg)
#define HYDRATION_INFO(msg) CITYSCALE_INFO("Hydration", msg)
#define HYDRATION_DEBUG(msg) CITYSCALE_DEBUG("Hydration", msg)

#define SIMULATION_CRITICAL(msg) CITYSCALE_CRITICAL("Simulation", msg)
#define SIMULATION_ERROR(msg) CITYSCALE_ERROR("Simulation", msg)
#define SIMULATION_WARN(msg) CITYSCALE_WARN("Simulation", msg)
#define SIMULATION_INFO(msg) CITYSCALE_INFO("Simulation", msg)
#define SIMULATION_DEBUG(msg) CITYSCALE_DEBUG("Simulation", msg)

#define TICKCLOCK_CRITICAL(msg) CITYSCALE_CRITICAL("TickClock", msg)
#define TICKCLOCK_ERROR(msg) CITYSCALE_ERROR("TickClock", msg)
#define TICKCLOCK_WARN(msg) CITYSCALE_WARN("TickClock", msg)
#define TICKCLOCK_INFO(msg) CITYSCALE_INFO("TickClock", msg)
#define TICKCLOCK_DEBUG(msg) CITYSCALE_DEBUG("TickClock", msg)

#define SETTINGS_CRITICAL(msg) CITYSCALE_CRITICAL("Settings", msg)
#define SETTINGS_ERROR(msg) CITYSCALE_ERROR("Settings", msg)
#define SETTINGS_WARNING(msg) CITYSCALE_WARN("Settings", msg)
#define SETTINGS_INFO(msg) CITYSCALE_INFO("Settings", msg)
#define SETTINGS_DEBUG(msg) CITYSCALE_DEBUG("Settings", msg)

// Benchmark mode convenience macros
#define CITYSCALE_ENABLE_BENCHMARK_MODE()                                      \
  CityScale::Logger::SetBenchmarkMode(true)
#define CITYSCALE_DISABLE_BENCHMARK_MODE()                                     \
  CityScale::Logger::SetBenchmarkMode(false)

} // namespace CityScale

#endif // LOGGER_HPP
