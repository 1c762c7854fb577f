/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SPAWN_REGION_HPP
#define SPAWN_REGION_HPP

#include "utils/Vector3D.hpp"
#include <string>
#include <utility>
#include <variant>

namespace HordeEngine
{

struct CircleShape
{
    float radius = 10.0f;
};

// Axis-aligned on the ground plane
struct RectangleShape
{
    float halfExtentX = 10.0f;
    float halfExtentZ = 10.0f;
};

using SpawnShape = std::variant<CircleShape, RectangleShape>;

/**
 * Named area agents may appear in
 *
 * minDistance/maxDistance describe the intended distance band from the
 * player. They are carried for map tooling and not enforced when sampling.
 */
struct SpawnRegion
{
    std::string id;
    float weight = 1.0f;
    float minDistance = 30.0f;
    float maxDistance = 80.0f;
    Vector3D center{0.0f, 0.0f, 0.0f};
    SpawnShape shape = CircleShape{};

    bool isCircle() const { return std::holds_alternative<CircleShape>(shape); }

    static SpawnRegion circle(std::string id, const Vector3D& center, float radius, float weight = 1.0f)
    {
        SpawnRegion region;
        region.id = std::move(id);
        region.center = center;
        region.weight = weight;
        region.shape = CircleShape{radius};
        return region;
    }

    static SpawnRegion rectangle(std::string id, const Vector3D& center, float halfExtentX,
                                 float halfExtentZ, float weight = 1.0f)
    {
        SpawnRegion region;
        region.id = std::move(id);
        region.center = center;
        region.weight = weight;
        region.shape = RectangleShape{halfExtentX, halfExtentZ};
        return region;
    }
};

} // namespace HordeEngine

#endif // SPAWN_REGION_HPP
