/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef AGENT_ARCHETYPE_HPP
#define AGENT_ARCHETYPE_HPP

#include <string>

namespace HordeEngine
{

/**
 * Stat block for one kind of hostile agent
 *
 * Omitted fields take the built-in "standard" values.
 */
struct AgentArchetype
{
    std::string id = "standard";
    float weight = 1.0f;                          // Relative spawn probability
    float health = 100.0f;
    float speed = 3.0f;                           // Chase speed in units/s
    float damage = 20.0f;                         // Applied per landed hit
    float detectionRange = 15.0f;                 // Perception radius in units
};

} // namespace HordeEngine

#endif // AGENT_ARCHETYPE_HPP
