/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef AGENT_BEHAVIOR_CONFIG_HPP
#define AGENT_BEHAVIOR_CONFIG_HPP

#include <string>

namespace HordeEngine
{

/**
 * Configuration for the hostile agent state machine
 *
 * Shared by every archetype; per-archetype stats (health, speed, damage,
 * detection range) live in AgentArchetype.
 */
struct AgentBehaviorConfig
{
    // Combat parameters
    float attackRange = 1.8f;                     // Distance at which chase turns into attack
    float attackLeashMultiplier = 1.2f;           // Attack drops back to chase beyond range * this
    float attackCooldown = 1.2f;                  // Seconds between attack triggers
    float hitDelay = 0.5f;                        // Seconds from trigger to damage check
    float recoveryDelay = 1.2f;                   // Seconds from trigger to return-to-chase

    // Steering
    float turnSpeed = 4.0f;                       // Yaw blend factor per second while chasing

    // Perception
    float perceptionInterval = 0.2f;              // Seconds between visibility refreshes
    float loseInterestTime = 8.0f;                // Seconds in chase without sight before idling

    // Idle fidget
    float idleDriftChance = 0.01f;                // Per-tick chance of a random yaw nudge
    float idleDriftMagnitude = 0.25f;             // Max yaw nudge in radians (either direction)

    // Distance tiering
    float farDistance = 50.0f;                    // Beyond this: no animation, coarse updates
    float veryFarDistance = 80.0f;                // Beyond this: position frozen
    float coarseUpdateInterval = 3.0f;            // Seconds between coarse updates when far

    // Presentation
    std::string modelKind = "zombie";             // Asset kind requested from the provider
    float modelScale = 0.01f;                     // Uniform scale applied to the loaded model
};

} // namespace HordeEngine

#endif // AGENT_BEHAVIOR_CONFIG_HPP
