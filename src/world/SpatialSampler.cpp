/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/SpatialSampler.hpp"
#include "core/Logger.hpp"
#include "core/PopulationErrors.hpp"
#include <cmath>
#include <format>

namespace HordeEngine
{

namespace {
constexpr float TWO_PI = 6.28318530718f;

// Overload set for std::visit over SpawnShape
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;
} // namespace

SpatialSampler::SpatialSampler() : m_rng(std::random_device{}()) {}

SpatialSampler::SpatialSampler(uint32_t seed) : m_rng(seed) {}

void SpatialSampler::validate(const SpawnRegion& region)
{
    if (region.weight <= 0.0f) {
        throw ConfigError(std::format("Spawn region '{}' has non-positive weight {}",
                                      region.id, region.weight));
    }

    std::visit(Overloaded{
        [&region](const CircleShape& circle) {
            if (circle.radius <= 0.0f) {
                throw ConfigError(std::format("Spawn region '{}' has non-positive radius {}",
                                              region.id, circle.radius));
            }
        },
        [&region](const RectangleShape& rect) {
            if (rect.halfExtentX < 0.0f || rect.halfExtentZ < 0.0f) {
                throw ConfigError(std::format("Spawn region '{}' has negative half extents",
                                              region.id));
            }
        }}, region.shape);
}

void SpatialSampler::configure(const std::vector<SpawnRegion>& regions)
{
    try {
        for (const auto& region : regions) {
            validate(region);
        }
    } catch (const ConfigError& e) {
        SPAWN_ERROR(std::format("Rejected spawn regions: {}", e.what()));
        throw;
    }

    m_regions = regions;
    m_totalWeight = 0.0f;
    for (const auto& region : m_regions) {
        m_totalWeight += region.weight;
    }

    if (m_regions.empty()) {
        SPAWN_WARN("No spawn regions configured; spawning around the player");
    } else {
        SPAWN_INFO(std::format("Configured {} spawn regions (total weight {:.2f})",
                               m_regions.size(), m_totalWeight));
    }
}

Vector3D SpatialSampler::sample(const Vector3D& playerPosition)
{
    if (m_regions.empty()) {
        return sampleAroundPlayer(playerPosition);
    }
    return sampleInRegion(pickRegion());
}

const SpawnRegion& SpatialSampler::pickRegion()
{
    std::uniform_real_distribution<float> dist(0.0f, m_totalWeight);
    const float roll = dist(m_rng);

    float cumulative = 0.0f;
    for (const auto& region : m_regions) {
        cumulative += region.weight;
        if (cumulative >= roll) {
            return region;
        }
    }
    // Floating-point drift
    return m_regions.back();
}

Vector3D SpatialSampler::sampleAroundPlayer(const Vector3D& playerPosition)
{
    std::uniform_real_distribution<float> distAngle(0.0f, TWO_PI);
    std::uniform_real_distribution<float> distRadius(DEFAULT_MIN_DISTANCE, DEFAULT_MAX_DISTANCE);

    const float angle = distAngle(m_rng);
    const float distance = distRadius(m_rng);

    return Vector3D(playerPosition.getX() + distance * std::cos(angle),
                    playerPosition.getY(),
                    playerPosition.getZ() + distance * std::sin(angle));
}

Vector3D SpatialSampler::sampleInRegion(const SpawnRegion& region)
{
    const Vector3D& center = region.center;

    return std::visit(Overloaded{
        [this, &center](const CircleShape& circle) {
            // Uniform radius, so points bunch toward the center
            std::uniform_real_distribution<float> distAngle(0.0f, TWO_PI);
            std::uniform_real_distribution<float> distRadius(0.0f, circle.radius);

            const float angle = distAngle(m_rng);
            const float radius = distRadius(m_rng);

            return Vector3D(center.getX() + radius * std::cos(angle),
                            center.getY(),
                            center.getZ() + radius * std::sin(angle));
        },
        [this, &center](const RectangleShape& rect) {
            std::uniform_real_distribution<float> distX(-rect.halfExtentX, rect.halfExtentX);
            std::uniform_real_distribution<float> distZ(-rect.halfExtentZ, rect.halfExtentZ);

            const float offsetX = distX(m_rng);
            const float offsetZ = distZ(m_rng);

            return Vector3D(center.getX() + offsetX, center.getY(), center.getZ() + offsetZ);
        }}, region.shape);
}

} // namespace HordeEngine
