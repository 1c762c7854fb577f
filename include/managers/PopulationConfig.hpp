/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef POPULATION_CONFIG_HPP
#define POPULATION_CONFIG_HPP

#include "ai/AgentArchetype.hpp"
#include <optional>
#include <string>
#include <vector>

namespace HordeEngine
{

/**
 * Population lifecycle settings
 *
 * Staged activation brings the preloaded roster online activationRate
 * agents at a time, every activationIntervalMs.
 */
struct PopulationConfig
{
    int maxPopulation = 100;                      // Agents built by preload
    bool preloadAtStart = true;                   // Host hint: preload before play begins
    int initialActiveCount = 20;                  // Agents enabled by activateInitialBatch
    int activationRate = 2;                       // Agents enabled per staged firing (>= 1)
    double activationIntervalMs = 1000.0;         // Milliseconds between staged firings (> 0)
};

/**
 * Partial update merged onto the current PopulationConfig
 *
 * Omitted fields keep their current values. A non-empty archetype list
 * replaces the registered archetypes; an empty one counts as omitted.
 */
struct PopulationConfigOverrides
{
    std::optional<int> maxPopulation;
    std::optional<bool> preloadAtStart;
    std::optional<int> initialActiveCount;
    std::optional<int> activationRate;
    std::optional<double> activationIntervalMs;
    std::vector<AgentArchetype> archetypes;
};

/**
 * Snapshot handed to the preload progress callback
 */
struct PreloadProgress
{
    int created = 0;
    int total = 0;
    float percent = 0.0f;                         // 0-100
    std::string status;                           // Loading-screen text
};

} // namespace HordeEngine

#endif // POPULATION_CONFIG_HPP
