/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SPATIAL_SAMPLER_HPP
#define SPATIAL_SAMPLER_HPP

#include "utils/Vector3D.hpp"
#include "world/SpawnRegion.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace HordeEngine
{

/**
 * @brief Picks spawn positions from weighted regions
 *
 * With no regions configured, points land on a ring 30-80 units around the
 * player at the player's elevation.
 */
class SpatialSampler
{
public:
    static constexpr float DEFAULT_MIN_DISTANCE = 30.0f;
    static constexpr float DEFAULT_MAX_DISTANCE = 80.0f;

    SpatialSampler();
    explicit SpatialSampler(uint32_t seed);

    /**
     * @brief Replace the region set
     *
     * An empty list switches to the player ring.
     * @throws ConfigError if a region has weight <= 0, radius <= 0 or a
     *         negative half extent; the previous set is kept.
     */
    void configure(const std::vector<SpawnRegion>& regions);

    Vector3D sample(const Vector3D& playerPosition);

    const std::vector<SpawnRegion>& getRegions() const { return m_regions; }
    float getTotalWeight() const { return m_totalWeight; }
    bool usesDefaultPolicy() const { return m_regions.empty(); }

private:
    static void validate(const SpawnRegion& region);
    const SpawnRegion& pickRegion();
    Vector3D sampleAroundPlayer(const Vector3D& playerPosition);
    Vector3D sampleInRegion(const SpawnRegion& region);

    std::vector<SpawnRegion> m_regions;
    float m_totalWeight{0.0f};

    std::mt19937 m_rng;
};

} // namespace HordeEngine

#endif // SPATIAL_SAMPLER_HPP
