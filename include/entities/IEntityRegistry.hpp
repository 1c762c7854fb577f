/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IENTITY_REGISTRY_HPP
#define IENTITY_REGISTRY_HPP

#include "entities/Entity.hpp"

/**
 * @brief Host-side entity bookkeeping
 *
 * Registered entities are updated by the host every simulation step.
 */
class IEntityRegistry {
public:
    virtual ~IEntityRegistry() = default;

    /**
     * @brief Start updating an entity
     * @return The identity assigned to the entity
     */
    virtual EntityID addEntity(EntityPtr entity) = 0;

    virtual void removeEntity(EntityPtr entity) = 0;
};

#endif // IENTITY_REGISTRY_HPP
