/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for serialized console output
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for serialized console output
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace Skybound {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
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
    printf("Skybound - [%s] %s: %s\n", system, getLevelString(level), message);
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

// Debug build macros - full functionality
#define SKYBOUND_CRITICAL(system, msg)                                         \
  Skybound::Logger::Log(Skybound::LogLevel::CRITICAL, system, msg)
#define SKYBOUND_ERROR(system, msg)                                            \
  Skybound::Logger::Log(Skybound::LogLevel::ERROR_LEVEL, system, msg)
#define SKYBOUND_WARN(system, msg)                                             \
  Skybound::Logger::Log(Skybound::LogLevel::WARNING, system, msg)
#define SKYBOUND_INFO(system, msg)                                             \
  Skybound::Logger::Log(Skybound::LogLevel::INFO, system, msg)
#define SKYBOUND_DEBUG(system, msg)                                            \
  Skybound::Logger::Log(Skybound::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL and ERROR go to a rotating log file (Logger.cpp)
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

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define SKYBOUND_CRITICAL(system, msg)                                         \
  Skybound::Logger::Log("CRITICAL", system, msg)

#define SKYBOUND_ERROR(system, msg) Skybound::Logger::Log("ERROR", system, msg)

#define SKYBOUND_WARN(system, msg) ((void)0)  // Zero overhead
#define SKYBOUND_INFO(system, msg) ((void)0)  // Zero overhead
#define SKYBOUND_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each subsystem

// Core Systems
#define GAMELOOP_CRITICAL(msg) SKYBOUND_CRITICAL("GameLoop", msg)
#define GAMELOOP_ERROR(msg) SKYBOUND_ERROR("GameLoop", msg)
#define GAMELOOP_WARN(msg) SKYBOUND_WARN("GameLoop", msg)
#define GAMELOOP_INFO(msg) SKYBOUND_INFO("GameLoop", msg)
#define GAMELOOP_DEBUG(msg) SKYBOUND_DEBUG("GameLoop", msg)

#define SESSION_CRITICAL(msg) SKYBOUND_CRITICAL("GameSession", msg)
#define SESSION_ERROR(msg) SKYBOUND_ERROR("GameSession", msg)
#define SESSION_WARN(msg) SKYBOUND_WARN("GameSession", msg)
#define SESSION_INFO(msg) SKYBOUND_INFO("GameSession", msg)
#define SESSION_DEBUG(msg) SKYBOUND_DEBUG("GameSession", msg)

#define CONFIG_CRITICAL(msg) SKYBOUND_CRITICAL("ConfigLoader", msg)
#define CONFIG_ERROR(msg) SKYBOUND_ERROR("ConfigLoader", msg)
#define CONFIG_WARN(msg) SKYBOUND_WARN("ConfigLoader", msg)
#define CONFIG_INFO(msg) SKYBOUND_INFO("ConfigLoader", msg)
#define CONFIG_DEBUG(msg) SKYBOUND_DEBUG("ConfigLoader", msg)

#define INPUT_CRITICAL(msg) SKYBOUND_CRITICAL("Input", msg)
#define INPUT_ERROR(msg) SKYBOUND_ERROR("Input", msg)
#define INPUT_WARN(msg) SKYBOUND_WARN("Input", msg)
#define INPUT_INFO(msg) SKYBOUND_INFO("Input", msg)
#define INPUT_DEBUG(msg) SKYBOUND_DEBUG("Input", msg)

// Simulation Systems
#define PHYSICS_CRITICAL(msg) SKYBOUND_CRITICAL("Physics", msg)
#define PHYSICS_ERROR(msg) SKYBOUND_ERROR("Physics", msg)
#define PHYSICS_WARN(msg) SKYBOUND_WARN("Physics", msg)
#define PHYSICS_INFO(msg) SKYBOUND_INFO("Physics", msg)
#define PHYSICS_DEBUG(msg) SKYBOUND_DEBUG("Physics", msg)

#define COLLISION_CRITICAL(msg) SKYBOUND_CRITICAL("CollisionResolver", msg)
#define COLLISION_ERROR(msg) SKYBOUND_ERROR("CollisionResolver", msg)
#define COLLISION_WARN(msg) SKYBOUND_WARN("CollisionResolver", msg)
#define COLLISION_INFO(msg) SKYBOUND_INFO("CollisionResolver", msg)
#define COLLISION_DEBUG(msg) SKYBOUND_DEBUG("CollisionResolver", msg)

#define BEHAVIOR_CRITICAL(msg) SKYBOUND_CRITICAL("EntityBehavior", msg)
#define BEHAVIOR_ERROR(msg) SKYBOUND_ERROR("EntityBehavior", msg)
#define BEHAVIOR_WARN(msg) SKYBOUND_WARN("EntityBehavior", msg)
#define BEHAVIOR_INFO(msg) SKYBOUND_INFO("EntityBehavior", msg)
#define BEHAVIOR_DEBUG(msg) SKYBOUND_DEBUG("EntityBehavior", msg)

#define PLAYER_CRITICAL(msg) SKYBOUND_CRITICAL("Player", msg)
#define PLAYER_ERROR(msg) SKYBOUND_ERROR("Player", msg)
#define PLAYER_WARN(msg) SKYBOUND_WARN("Player", msg)
#define PLAYER_INFO(msg) SKYBOUND_INFO("Player", msg)
#define PLAYER_DEBUG(msg) SKYBOUND_DEBUG("Player", msg)

// Level Systems
#define LEVELGEN_CRITICAL(msg) SKYBOUND_CRITICAL("LevelGenerator", msg)
#define LEVELGEN_ERROR(msg) SKYBOUND_ERROR("LevelGenerator", msg)
#define LEVELGEN_WARN(msg) SKYBOUND_WARN("LevelGenerator", msg)
#define LEVELGEN_INFO(msg) SKYBOUND_INFO("LevelGenerator", msg)
#define LEVELGEN_DEBUG(msg) SKYBOUND_DEBUG("LevelGenerator", msg)

#define DIFFICULTY_CRITICAL(msg) SKYBOUND_CRITICAL("DifficultyScaler", msg)
#define DIFFICULTY_ERROR(msg) SKYBOUND_ERROR("DifficultyScaler", msg)
#define DIFFICULTY_WARN(msg) SKYBOUND_WARN("DifficultyScaler", msg)
#define DIFFICULTY_INFO(msg) SKYBOUND_INFO("DifficultyScaler", msg)
#define DIFFICULTY_DEBUG(msg) SKYBOUND_DEBUG("DifficultyScaler", msg)

// Benchmark mode convenience macros
#define SKYBOUND_ENABLE_BENCHMARK_MODE() Skybound::Logger::SetBenchmarkMode(true)
#define SKYBOUND_DISABLE_BENCHMARK_MODE()                                      \
  Skybound::Logger::SetBenchmarkMode(false)

} // namespace Skybound

#endif // LOGGER_HPP
