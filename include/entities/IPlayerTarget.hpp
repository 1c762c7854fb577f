/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IPLAYER_TARGET_HPP
#define IPLAYER_TARGET_HPP

#include "utils/Vector3D.hpp"

class Entity;

/**
 * @brief The one external signal agents react to
 */
class IPlayerTarget {
public:
    virtual ~IPlayerTarget() = default;

    // Returned by value; callers snapshot it once per tick
    virtual Vector3D getPosition() const = 0;

    virtual void takeDamage(float amount, const Entity& source) = 0;
};

#endif // IPLAYER_TARGET_HPP
