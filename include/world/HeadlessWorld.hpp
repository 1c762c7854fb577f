/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef HEADLESS_WORLD_HPP
#define HEADLESS_WORLD_HPP

#include "collisions/IPhysicsService.hpp"
#include "core/DeferredTaskQueue.hpp"
#include "entities/Agent.hpp"
#include "entities/IEntityRegistry.hpp"
#include "entities/IPlayerTarget.hpp"
#include "managers/IAssetProvider.hpp"
#include <boost/container/flat_map.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace HordeEngine
{

// Keeps registered entities and updates them each step
class SimpleEntityRegistry : public IEntityRegistry
{
public:
    EntityID addEntity(EntityPtr entity) override;
    void removeEntity(EntityPtr entity) override;

    void updateAll(float deltaTime);
    size_t size() const { return m_entities.size(); }

private:
    std::vector<EntityPtr> m_entities;
    EntityID m_nextID{1};
};

// Integrates velocity into position; no collisions or gravity
class KinematicPhysics : public IPhysicsService
{
public:
    bool addBody(PhysicsBody& body) override;
    void removeBody(PhysicsBody& body) override;

    void step(float deltaTime);
    size_t getBodyCount() const { return m_bodies.size(); }

private:
    std::vector<PhysicsBody*> m_bodies;
};

// In-memory asset cache filled by the host at startup
class InMemoryAssetProvider : public IAssetProvider
{
public:
    void addModel(const std::string& kind, float unitScale = 1.0f);
    void addAnimation(const std::string& id, float duration);

    std::shared_ptr<const ModelAsset> getModel(const std::string& kind) const override;
    std::shared_ptr<const AnimationClip> getAnimation(const std::string& id) const override;

private:
    boost::container::flat_map<std::string, std::shared_ptr<const ModelAsset>> m_models;
    boost::container::flat_map<std::string, std::shared_ptr<const AnimationClip>> m_animations;
};

// Player stand-in that walks a slow circle around the origin
class OrbitingPlayer : public IPlayerTarget
{
public:
    OrbitingPlayer(float orbitRadius, float angularSpeed);

    Vector3D getPosition() const override { return m_position; }
    void takeDamage(float amount, const Entity& source) override;

    void update(float deltaTime);

    float getHealth() const { return m_health; }
    int getHitsTaken() const { return m_hitsTaken; }

private:
    Vector3D m_position;
    float m_orbitRadius;
    float m_angularSpeed;
    float m_angle{0.0f};
    float m_health{1000.0f};
    int m_hitsTaken{0};
};

/**
 * Bundles the host services the population core needs so the demo can run
 * without a renderer or a real physics solver.
 */
class HeadlessWorld
{
public:
    HeadlessWorld();

    AgentServices getServices();

    // One fixed simulation step
    void step(float deltaTime);

    SimpleEntityRegistry& getRegistry() { return m_registry; }
    KinematicPhysics& getPhysics() { return m_physics; }
    InMemoryAssetProvider& getAssets() { return m_assets; }
    OrbitingPlayer& getPlayer() { return m_player; }
    DeferredTaskQueue& getScheduler() { return m_scheduler; }

private:
    KinematicPhysics m_physics;
    InMemoryAssetProvider m_assets;
    OrbitingPlayer m_player;
    DeferredTaskQueue m_scheduler;
    // Declared last so registered agents release their bodies first
    SimpleEntityRegistry m_registry;
};

} // namespace HordeEngine

#endif // HEADLESS_WORLD_HPP
