/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHYSICS_BODY_HPP
#define PHYSICS_BODY_HPP

#include "utils/Vector3D.hpp"

namespace HordeEngine {

/**
 * @brief Rigid body handed to the host physics service
 *
 * The owning agent writes horizontal velocity; the physics service
 * integrates it and writes position back. Defaults match a human-sized
 * walker.
 */
struct PhysicsBody {
    Vector3D position{0.0f, 0.0f, 0.0f};
    Vector3D velocity{0.0f, 0.0f, 0.0f};
    float mass{70.0f};
    float radius{0.5f};
    float restitution{0.2f};
    float friction{0.5f};
};

} // namespace HordeEngine

#endif // PHYSICS_BODY_HPP
