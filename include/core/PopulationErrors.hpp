/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POPULATION_ERRORS_HPP
#define POPULATION_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace HordeEngine {

/**
 * @brief Failure categories raised by the population core
 *
 * None of these end the session. ConfigError rejects bad input at
 * configuration time; the others are recovered where they occur and are
 * only surfaced through logs, degraded flags, or a false return.
 */
enum class PopulationErrorCode : uint8_t {
  None = 0,
  ConfigError,        // Malformed archetype/region/population settings
  AssetLoadError,     // Missing or unreadable model/animation
  PreloadError,       // Preload requested without a player reference
  PhysicsAttachError  // Rigid body registration refused
};

inline const char *toString(PopulationErrorCode code) {
  switch (code) {
  case PopulationErrorCode::None:
    return "None";
  case PopulationErrorCode::ConfigError:
    return "ConfigError";
  case PopulationErrorCode::AssetLoadError:
    return "AssetLoadError";
  case PopulationErrorCode::PreloadError:
    return "PreloadError";
  case PopulationErrorCode::PhysicsAttachError:
    return "PhysicsAttachError";
  }
  return "Unknown";
}

class PopulationError : public std::runtime_error {
public:
  PopulationError(PopulationErrorCode code, const std::string &message)
      : std::runtime_error(message), m_code(code) {}

  PopulationErrorCode code() const { return m_code; }

private:
  PopulationErrorCode m_code;
};

class ConfigError : public PopulationError {
public:
  explicit ConfigError(const std::string &message)
      : PopulationError(PopulationErrorCode::ConfigError, message) {}
};

class AssetLoadError : public PopulationError {
public:
  explicit AssetLoadError(const std::string &message)
      : PopulationError(PopulationErrorCode::AssetLoadError, message) {}
};

class PreloadError : public PopulationError {
public:
  explicit PreloadError(const std::string &message)
      : PopulationError(PopulationErrorCode::PreloadError, message) {}
};

class PhysicsAttachError : public PopulationError {
public:
  explicit PhysicsAttachError(const std::string &message)
      : PopulationError(PopulationErrorCode::PhysicsAttachError, message) {}
};

} // namespace HordeEngine

#endif // POPULATION_ERRORS_HPP
