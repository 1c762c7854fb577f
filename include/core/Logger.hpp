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
// - mutex: Required for thread-safe logging
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace HordeEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Release: file only
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
class Logger {
private:
  static inline std::mutex s_logMutex{};

public:
  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Horde Engine - [%s] %s: %s\n", system, getLevelString(level),
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

#define HORDE_CRITICAL(system, msg)                                            \
  HordeEngine::Logger::Log(HordeEngine::LogLevel::CRITICAL, system, msg)
#define HORDE_ERROR(system, msg)                                               \
  HordeEngine::Logger::Log(HordeEngine::LogLevel::ERROR_LEVEL, system, msg)
#define HORDE_WARN(system, msg)                                                \
  HordeEngine::Logger::Log(HordeEngine::LogLevel::WARNING, system, msg)
#define HORDE_INFO(system, msg)                                                \
  HordeEngine::Logger::Log(HordeEngine::LogLevel::INFO, system, msg)
#define HORDE_DEBUG(system, msg)                                               \
  HordeEngine::Logger::Log(HordeEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL/ERROR go to the per-run session log (Logger.cpp)
class Logger {
public:
  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define HORDE_CRITICAL(system, msg)                                            \
  HordeEngine::Logger::Log("CRITICAL", system, msg)

#define HORDE_ERROR(system, msg)                                               \
  HordeEngine::Logger::Log("ERROR", system, msg)

#define HORDE_WARN(system, msg) ((void)0)  // Zero overhead
#define HORDE_INFO(system, msg) ((void)0)  // Zero overhead
#define HORDE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Convenience macros for each system

// Core Systems
#define GAMELOOP_CRITICAL(msg) HORDE_CRITICAL("GameLoop", msg)
#define GAMELOOP_ERROR(msg) HORDE_ERROR("GameLoop", msg)
#define GAMELOOP_WARN(msg) HORDE_WARN("GameLoop", msg)
#define GAMELOOP_INFO(msg) HORDE_INFO("GameLoop", msg)
#define GAMELOOP_DEBUG(msg) HORDE_DEBUG("GameLoop", msg)

#define SCHEDULER_CRITICAL(msg) HORDE_CRITICAL("DeferredTaskQueue", msg)
#define SCHEDULER_ERROR(msg) HORDE_ERROR("DeferredTaskQueue", msg)
#define SCHEDULER_WARN(msg) HORDE_WARN("DeferredTaskQueue", msg)
#define SCHEDULER_INFO(msg) HORDE_INFO("DeferredTaskQueue", msg)
#define SCHEDULER_DEBUG(msg) HORDE_DEBUG("DeferredTaskQueue", msg)

// Population Systems
#define POPULATION_CRITICAL(msg) HORDE_CRITICAL("PopulationManager", msg)
#define POPULATION_ERROR(msg) HORDE_ERROR("PopulationManager", msg)
#define POPULATION_WARN(msg) HORDE_WARN("PopulationManager", msg)
#define POPULATION_INFO(msg) HORDE_INFO("PopulationManager", msg)
#define POPULATION_DEBUG(msg) HORDE_DEBUG("PopulationManager", msg)

#define SPAWN_CRITICAL(msg) HORDE_CRITICAL("SpatialSampler", msg)
#define SPAWN_ERROR(msg) HORDE_ERROR("SpatialSampler", msg)
#define SPAWN_WARN(msg) HORDE_WARN("SpatialSampler", msg)
#define SPAWN_INFO(msg) HORDE_INFO("SpatialSampler", msg)
#define SPAWN_DEBUG(msg) HORDE_DEBUG("SpatialSampler", msg)

#define CATALOG_CRITICAL(msg) HORDE_CRITICAL("PopulationCatalog", msg)
#define CATALOG_ERROR(msg) HORDE_ERROR("PopulationCatalog", msg)
#define CATALOG_WARN(msg) HORDE_WARN("PopulationCatalog", msg)
#define CATALOG_INFO(msg) HORDE_INFO("PopulationCatalog", msg)
#define CATALOG_DEBUG(msg) HORDE_DEBUG("PopulationCatalog", msg)

// Entity and State Systems
#define AGENT_CRITICAL(msg) HORDE_CRITICAL("Agent", msg)
#define AGENT_ERROR(msg) HORDE_ERROR("Agent", msg)
#define AGENT_WARN(msg) HORDE_WARN("Agent", msg)
#define AGENT_INFO(msg) HORDE_INFO("Agent", msg)
#define AGENT_DEBUG(msg) HORDE_DEBUG("Agent", msg)

#define ENTITYSTATE_CRITICAL(msg) HORDE_CRITICAL("AgentStateMachine", msg)
#define ENTITYSTATE_ERROR(msg) HORDE_ERROR("AgentStateMachine", msg)
#define ENTITYSTATE_WARN(msg) HORDE_WARN("AgentStateMachine", msg)
#define ENTITYSTATE_INFO(msg) HORDE_INFO("AgentStateMachine", msg)
#define ENTITYSTATE_DEBUG(msg) HORDE_DEBUG("AgentStateMachine", msg)

// Demo host services
#define WORLD_CRITICAL(msg) HORDE_CRITICAL("HeadlessWorld", msg)
#define WORLD_ERROR(msg) HORDE_ERROR("HeadlessWorld", msg)
#define WORLD_WARN(msg) HORDE_WARN("HeadlessWorld", msg)
#define WORLD_INFO(msg) HORDE_INFO("HeadlessWorld", msg)
#define WORLD_DEBUG(msg) HORDE_DEBUG("HeadlessWorld", msg)

} // namespace HordeEngine

#endif // LOGGER_HPP
