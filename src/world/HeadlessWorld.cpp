/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/HeadlessWorld.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace HordeEngine
{

EntityID SimpleEntityRegistry::addEntity(EntityPtr entity)
{
    const EntityID id = m_nextID++;
    m_entities.push_back(std::move(entity));
    return id;
}

void SimpleEntityRegistry::removeEntity(EntityPtr entity)
{
    m_entities.erase(std::remove(m_entities.begin(), m_entities.end(), entity),
                     m_entities.end());
}

void SimpleEntityRegistry::updateAll(float deltaTime)
{
    // Copy so entities may be removed by callbacks fired mid-update
    const std::vector<EntityPtr> snapshot = m_entities;
    for (const auto& entity : snapshot) {
        entity->update(deltaTime);
    }
}

bool KinematicPhysics::addBody(PhysicsBody& body)
{
    if (std::find(m_bodies.begin(), m_bodies.end(), &body) == m_bodies.end()) {
        m_bodies.push_back(&body);
    }
    return true;
}

void KinematicPhysics::removeBody(PhysicsBody& body)
{
    m_bodies.erase(std::remove(m_bodies.begin(), m_bodies.end(), &body), m_bodies.end());
}

void KinematicPhysics::step(float deltaTime)
{
    for (PhysicsBody* body : m_bodies) {
        body->position += body->velocity * deltaTime;
    }
}

void InMemoryAssetProvider::addModel(const std::string& kind, float unitScale)
{
    m_models[kind] = std::make_shared<const ModelAsset>(ModelAsset{kind, unitScale});
}

void InMemoryAssetProvider::addAnimation(const std::string& id, float duration)
{
    m_animations[id] = std::make_shared<const AnimationClip>(AnimationClip{id, duration});
}

std::shared_ptr<const ModelAsset> InMemoryAssetProvider::getModel(const std::string& kind) const
{
    auto it = m_models.find(kind);
    return it != m_models.end() ? it->second : nullptr;
}

std::shared_ptr<const AnimationClip> InMemoryAssetProvider::getAnimation(const std::string& id) const
{
    auto it = m_animations.find(id);
    return it != m_animations.end() ? it->second : nullptr;
}

OrbitingPlayer::OrbitingPlayer(float orbitRadius, float angularSpeed)
    : m_position(orbitRadius, 0.0f, 0.0f), m_orbitRadius(orbitRadius),
      m_angularSpeed(angularSpeed) {}

void OrbitingPlayer::update(float deltaTime)
{
    m_angle += m_angularSpeed * deltaTime;
    m_position = Vector3D(m_orbitRadius * std::cos(m_angle), 0.0f,
                          m_orbitRadius * std::sin(m_angle));
}

void OrbitingPlayer::takeDamage(float amount, const Entity& source)
{
    m_health -= amount;
    ++m_hitsTaken;
    WORLD_DEBUG(std::format("Player hit by agent {} for {:.1f} (health {:.1f})",
                            source.getID(), amount, m_health));
}

HeadlessWorld::HeadlessWorld() : m_player(20.0f, 0.15f) {}

AgentServices HeadlessWorld::getServices()
{
    AgentServices services;
    services.physics = &m_physics;
    services.assets = &m_assets;
    services.player = &m_player;
    services.scheduler = &m_scheduler;
    return services;
}

void HeadlessWorld::step(float deltaTime)
{
    m_player.update(deltaTime);
    m_registry.updateAll(deltaTime);
    m_physics.step(deltaTime);
    m_scheduler.advance(deltaTime);
}

} // namespace HordeEngine
