/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MOCK_HOST_SERVICES_HPP
#define MOCK_HOST_SERVICES_HPP

#include "collisions/IPhysicsService.hpp"
#include "core/PopulationErrors.hpp"
#include "entities/IEntityRegistry.hpp"
#include "managers/IAssetProvider.hpp"
#include <algorithm>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Physics stand-in: integrates velocity on step(), can refuse or throw on attach
class MockPhysicsService : public HordeEngine::IPhysicsService {
public:
    enum class AttachMode { Accept, Refuse, Throw };

    bool addBody(HordeEngine::PhysicsBody& body) override {
        ++addCalls;
        if (attachMode == AttachMode::Throw) {
            throw HordeEngine::PhysicsAttachError("mock solver is full");
        }
        if (addCalls == crashOnCall) {
            throw std::runtime_error("mock solver crashed");
        }
        if (attachMode == AttachMode::Refuse) {
            return false;
        }
        bodies.push_back(&body);
        return true;
    }

    void removeBody(HordeEngine::PhysicsBody& body) override {
        ++removeCalls;
        bodies.erase(std::remove(bodies.begin(), bodies.end(), &body), bodies.end());
    }

    void step(float deltaTime) {
        for (auto* body : bodies) {
            body->position += body->velocity * deltaTime;
        }
    }

    AttachMode attachMode = AttachMode::Accept;
    int crashOnCall = 0; // 1-based addBody call that throws a non-physics error
    std::vector<HordeEngine::PhysicsBody*> bodies;
    int addCalls = 0;
    int removeCalls = 0;
};

// Asset stand-in with the full clip set unless told otherwise
class MockAssetProvider : public HordeEngine::IAssetProvider {
public:
    MockAssetProvider() {
        addModel("zombie");
        for (const char* clip : {"idle", "walk", "run", "attack", "death"}) {
            addClip(clip, 1.0f);
        }
    }

    void addModel(const std::string& kind) {
        models[kind] = std::make_shared<const HordeEngine::ModelAsset>(
            HordeEngine::ModelAsset{kind, 100.0f});
    }

    void addClip(const std::string& name, float duration) {
        clips[name] = std::make_shared<const HordeEngine::AnimationClip>(
            HordeEngine::AnimationClip{name, duration});
    }

    std::shared_ptr<const HordeEngine::ModelAsset> getModel(const std::string& kind) const override {
        if (throwOnModel) {
            throw HordeEngine::AssetLoadError("corrupt model file: " + kind);
        }
        if (crashOnModel) {
            throw std::runtime_error("asset cache unavailable");
        }
        auto it = models.find(kind);
        return it != models.end() ? it->second : nullptr;
    }

    std::shared_ptr<const HordeEngine::AnimationClip> getAnimation(const std::string& id) const override {
        if (id == crashOnClip) {
            throw std::runtime_error("asset cache unavailable");
        }
        auto it = clips.find(id);
        return it != clips.end() ? it->second : nullptr;
    }

    std::map<std::string, std::shared_ptr<const HordeEngine::ModelAsset>> models;
    std::map<std::string, std::shared_ptr<const HordeEngine::AnimationClip>> clips;
    bool throwOnModel = false;
    bool crashOnModel = false;
    std::string crashOnClip;
};

// Entity registry stand-in that also drives entity updates
class MockEntityRegistry : public IEntityRegistry {
public:
    EntityID addEntity(EntityPtr entity) override {
        ++addCalls;
        entities.push_back(std::move(entity));
        return nextID++;
    }

    void removeEntity(EntityPtr entity) override {
        ++removeCalls;
        entities.erase(std::remove(entities.begin(), entities.end(), entity), entities.end());
    }

    bool contains(const EntityPtr& entity) const {
        return std::find(entities.begin(), entities.end(), entity) != entities.end();
    }

    void updateAll(float deltaTime) {
        const auto snapshot = entities;
        for (const auto& entity : snapshot) {
            entity->update(deltaTime);
        }
    }

    std::vector<EntityPtr> entities;
    EntityID nextID = 1;
    int addCalls = 0;
    int removeCalls = 0;
};

#endif // MOCK_HOST_SERVICES_HPP
