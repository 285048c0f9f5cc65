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

namespace LatticeEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full logging system in debug builds - console output
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

  // Debug builds always log to the console
  static void SetLogDirectory(const std::string &) {}

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Lattice Engine - [%s] %s: %s\n", system, getLevelString(level),
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

#define LATTICE_CRITICAL(system, msg)                                          \
  LatticeEngine::Logger::Log(LatticeEngine::LogLevel::CRITICAL, system, msg)
#define LATTICE_ERROR(system, msg)                                             \
  LatticeEngine::Logger::Log(LatticeEngine::LogLevel::ERROR_LEVEL, system, msg)
#define LATTICE_WARN(system, msg)                                              \
  LatticeEngine::Logger::Log(LatticeEngine::LogLevel::WARNING, system, msg)
#define LATTICE_INFO(system, msg)                                              \
  LatticeEngine::Logger::Log(LatticeEngine::LogLevel::INFO, system, msg)
#define LATTICE_DEBUG(system, msg)                                             \
  LatticeEngine::Logger::Log(LatticeEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - file output for CRITICAL/ERROR, everything else compiled out
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

  /**
   * Directory that receives release log files. Until the host sets one,
   * release logging is disabled.
   */
  static void SetLogDirectory(const std::string &directory);

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define LATTICE_CRITICAL(system, msg)                                          \
  LatticeEngine::Logger::Log("CRITICAL", system, msg)

#define LATTICE_ERROR(system, msg)                                             \
  LatticeEngine::Logger::Log("ERROR", system, msg)

#define LATTICE_WARN(system, msg) ((void)0)  // Zero overhead
#define LATTICE_INFO(system, msg) ((void)0)  // Zero overhead
#define LATTICE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each subsystem

// Host loop
#define GAMELOOP_CRITICAL(msg) LATTICE_CRITICAL("GameLoop", msg)
#define GAMELOOP_ERROR(msg) LATTICE_ERROR("GameLoop", msg)
#define GAMELOOP_WARN(msg) LATTICE_WARN("GameLoop", msg)
#define GAMELOOP_INFO(msg) LATTICE_INFO("GameLoop", msg)
#define GAMELOOP_DEBUG(msg) LATTICE_DEBUG("GameLoop", msg)

#define RENDER_CRITICAL(msg) LATTICE_CRITICAL("ShapeRenderer", msg)
#define RENDER_ERROR(msg) LATTICE_ERROR("ShapeRenderer", msg)
#define RENDER_WARN(msg) LATTICE_WARN("ShapeRenderer", msg)
#define RENDER_INFO(msg) LATTICE_INFO("ShapeRenderer", msg)
#define RENDER_DEBUG(msg) LATTICE_DEBUG("ShapeRenderer", msg)

// Simulation core
#define SCHEDULER_CRITICAL(msg) LATTICE_CRITICAL("NodeScheduler", msg)
#define SCHEDULER_ERROR(msg) LATTICE_ERROR("NodeScheduler", msg)
#define SCHEDULER_WARN(msg) LATTICE_WARN("NodeScheduler", msg)
#define SCHEDULER_INFO(msg) LATTICE_INFO("NodeScheduler", msg)
#define SCHEDULER_DEBUG(msg) LATTICE_DEBUG("NodeScheduler", msg)

#define TIMER_CRITICAL(msg) LATTICE_CRITICAL("TimerRegistry", msg)
#define TIMER_ERROR(msg) LATTICE_ERROR("TimerRegistry", msg)
#define TIMER_WARN(msg) LATTICE_WARN("TimerRegistry", msg)
#define TIMER_INFO(msg) LATTICE_INFO("TimerRegistry", msg)
#define TIMER_DEBUG(msg) LATTICE_DEBUG("TimerRegistry", msg)

#define CHUNK_CRITICAL(msg) LATTICE_CRITICAL("ChunkIndex", msg)
#define CHUNK_ERROR(msg) LATTICE_ERROR("ChunkIndex", msg)
#define CHUNK_WARN(msg) LATTICE_WARN("ChunkIndex", msg)
#define CHUNK_INFO(msg) LATTICE_INFO("ChunkIndex", msg)
#define CHUNK_DEBUG(msg) LATTICE_DEBUG("ChunkIndex", msg)

#define SIMSTATE_CRITICAL(msg) LATTICE_CRITICAL("SimulationState", msg)
#define SIMSTATE_ERROR(msg) LATTICE_ERROR("SimulationState", msg)
#define SIMSTATE_WARN(msg) LATTICE_WARN("SimulationState", msg)
#define SIMSTATE_INFO(msg) LATTICE_INFO("SimulationState", msg)
#define SIMSTATE_DEBUG(msg) LATTICE_DEBUG("SimulationState", msg)

#define ANIMATION_CRITICAL(msg) LATTICE_CRITICAL("Animation", msg)
#define ANIMATION_ERROR(msg) LATTICE_ERROR("Animation", msg)
#define ANIMATION_WARN(msg) LATTICE_WARN("Animation", msg)
#define ANIMATION_INFO(msg) LATTICE_INFO("Animation", msg)
#define ANIMATION_DEBUG(msg) LATTICE_DEBUG("Animation", msg)

// State and settings management
#define GAMESTATE_CRITICAL(msg) LATTICE_CRITICAL("GameStateManager", msg)
#define GAMESTATE_ERROR(msg) LATTICE_ERROR("GameStateManager", msg)
#define GAMESTATE_WARN(msg) LATTICE_WARN("GameStateManager", msg)
#define GAMESTATE_INFO(msg) LATTICE_INFO("GameStateManager", msg)
#define GAMESTATE_DEBUG(msg) LATTICE_DEBUG("GameStateManager", msg)

#define SETTINGS_CRITICAL(msg) LATTICE_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) LATTICE_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) LATTICE_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) LATTICE_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) LATTICE_DEBUG("SettingsManager", msg)

// Benchmark mode convenience macros
#define LATTICE_ENABLE_BENCHMARK_MODE()                                        \
  LatticeEngine::Logger::SetBenchmarkMode(true)
#define LATTICE_DISABLE_BENCHMARK_MODE()                                       \
  LatticeEngine::Logger::SetBenchmarkMode(false)

} // namespace LatticeEngine

#endif // LOGGER_HPP
