/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef DISTANCE_TIER_HPP
#define DISTANCE_TIER_HPP

#include <cstdint>

namespace HordeEngine
{

/**
 * Update-cost bands by distance to the player
 */
enum class DistanceTier : uint8_t
{
    Near,       // Full animation, perception and state every tick
    Far,        // Coarse perception/state, no animation
    VeryFar     // As Far, and position is not pulled from physics
};

inline DistanceTier classifyDistance(float distance, float farDistance, float veryFarDistance)
{
    if (distance > veryFarDistance) {
        return DistanceTier::VeryFar;
    }
    if (distance > farDistance) {
        return DistanceTier::Far;
    }
    return DistanceTier::Near;
}

inline const char* toString(DistanceTier tier)
{
    switch (tier) {
        case DistanceTier::Near: return "Near";
        case DistanceTier::Far: return "Far";
        case DistanceTier::VeryFar: return "VeryFar";
    }
    return "Unknown";
}

} // namespace HordeEngine

#endif // DISTANCE_TIER_HPP
