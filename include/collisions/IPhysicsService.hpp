/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IPHYSICS_SERVICE_HPP
#define IPHYSICS_SERVICE_HPP

#include "collisions/PhysicsBody.hpp"

namespace HordeEngine {

/**
 * @brief Host rigid-body solver, treated as a black box
 *
 * Bodies stay owned by the caller and must outlive their registration.
 */
class IPhysicsService {
public:
    virtual ~IPhysicsService() = default;

    /**
     * @brief Register a body with the solver
     * @return false if the solver refused the body
     * @throws PhysicsAttachError on hard failure
     */
    virtual bool addBody(PhysicsBody& body) = 0;

    // Removing a body that is not registered is a no-op
    virtual void removeBody(PhysicsBody& body) = 0;
};

} // namespace HordeEngine

#endif // IPHYSICS_SERVICE_HPP
