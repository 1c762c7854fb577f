/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_HPP
#define AGENT_HPP

#include "ai/AgentArchetype.hpp"
#include "ai/AgentBehaviorConfig.hpp"
#include "ai/DistanceTier.hpp"
#include "collisions/PhysicsBody.hpp"
#include "core/DeferredTaskQueue.hpp"
#include "entities/AgentAnimator.hpp"
#include "entities/AgentStateMachine.hpp"
#include "entities/Entity.hpp"
#include "utils/Vector3D.hpp"
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace HordeEngine {
class IPhysicsService;
class IAssetProvider;
struct ModelAsset;
} // namespace HordeEngine
class IPlayerTarget;

/**
 * @brief Host services an agent talks to
 *
 * All pointers are non-owning and must outlive every agent built with them.
 * Only the scheduler is mandatory; a missing physics service puts agents in
 * degraded movement, a missing asset provider gives them placeholder
 * visuals, and a missing player leaves them idle.
 */
struct AgentServices {
  HordeEngine::IPhysicsService *physics{nullptr};
  HordeEngine::IAssetProvider *assets{nullptr};
  IPlayerTarget *player{nullptr};
  HordeEngine::DeferredTaskQueue *scheduler{nullptr};
};

// One box of the placeholder body used when the model is unavailable
struct AgentVisualPart {
  std::string name;
  Vector3D size;
  Vector3D offset;
};

/**
 * @brief Presentation state the host mirrors into its scene graph
 */
struct AgentVisual {
  std::shared_ptr<const HordeEngine::ModelAsset> model;
  std::vector<AgentVisualPart> placeholderParts;
  float scale{1.0f};
  Vector3D position;
  float yaw{0.0f};

  bool isPlaceholder() const { return model == nullptr; }
};

class Agent;
using AgentPtr = std::shared_ptr<Agent>;

class Agent : public Entity {
public:
  /**
   * @throws std::invalid_argument if services.scheduler is null
   */
  Agent(const HordeEngine::AgentArchetype &archetype,
        const Vector3D &startPosition, const AgentServices &services,
        const HordeEngine::AgentBehaviorConfig &config =
            HordeEngine::AgentBehaviorConfig{});
  ~Agent() override;

  // Factory method to ensure agents are always created with shared_ptr and
  // fully initialized (physics attached, model and clips loaded)
  static AgentPtr create(const HordeEngine::AgentArchetype &archetype,
                         const Vector3D &startPosition,
                         const AgentServices &services,
                         const HordeEngine::AgentBehaviorConfig &config =
                             HordeEngine::AgentBehaviorConfig{}) {
    auto agent =
        std::make_shared<Agent>(archetype, startPosition, services, config);
    agent->init();
    return agent;
  }

  /**
   * @brief Attach physics, load the model and clips, enter idle
   *
   * Asset and physics failures are recovered here and never escape.
   * Calling init() twice does nothing.
   */
  void init();

  void update(float deltaTime) override;
  void clean() override;

  void setPosition(const Vector3D &position) override;
  void setVelocity(const Vector3D &velocity) override;

  // Combat system
  void takeDamage(float amount);
  bool isAlive() const { return m_isAlive; }
  float getHealth() const { return m_health; }
  float getMaxHealth() const { return m_maxHealth; }

  // True while the player was inside detection range at the last refresh
  bool canSensePlayer() const { return m_canSeePlayer; }
  // True if the player is currently within attack range
  bool canAttackTarget() const;

  void changeState(AgentStateId newState);
  AgentStateId getState() const { return m_stateMachine.getCurrentStateId(); }
  float getTimeInState() const { return m_timeInState; }
  float getTimeAlive() const { return m_timeAlive; }

  void setEnabled(bool enabled) { m_enabled = enabled; }
  bool isEnabled() const { return m_enabled; }

  const std::string &getArchetypeId() const { return m_archetype.id; }
  const HordeEngine::AgentArchetype &getArchetype() const { return m_archetype; }
  const HordeEngine::AgentBehaviorConfig &getBehaviorConfig() const { return m_config; }

  const std::optional<Vector3D> &getLastKnownPlayerPosition() const {
    return m_lastKnownPlayerPosition;
  }
  HordeEngine::DistanceTier getDistanceTier() const { return m_tier; }

  bool isPhysicsAttached() const { return m_bodyAttached; }
  bool isDegradedMovement() const { return m_degradedMovement; }
  const HordeEngine::PhysicsBody &getPhysicsBody() const { return m_body; }
  const AgentVisual &getVisual() const { return m_visual; }
  const AgentAnimator &getAnimator() const { return m_animator; }
  size_t getPendingTaskCount() const;

  // Per-state behavior, driven by the agentStates classes
  void processIdle(float deltaTime);
  void processChase(float deltaTime);
  void processAttack(float deltaTime);
  void zeroHorizontalVelocity();
  void markDead();

private:
  void setupStates();
  void attachPhysicsBody();
  void detachPhysicsBody();
  void loadModel();
  void loadAnimations();
  void createPlaceholderVisual();

  void updatePerception(float deltaTime);
  void processStateMachine(float deltaTime);
  void syncPositionFromBody(float deltaTime);
  void refreshVisualTransform();

  void faceTowards(const Vector3D &target);
  void setHorizontalVelocity(float x, float z);
  void triggerAttack();
  void resolveHit();
  void resolveRecovery();
  void trackTask(HordeEngine::TaskHandle handle);
  void cancelPendingTasks();

  HordeEngine::AgentArchetype m_archetype;
  HordeEngine::AgentBehaviorConfig m_config;
  AgentServices m_services;

  AgentStateMachine m_stateMachine;
  AgentAnimator m_animator;
  AgentVisual m_visual;
  HordeEngine::PhysicsBody m_body;

  float m_health{100.0f};
  float m_maxHealth{100.0f};
  bool m_isAlive{true};
  bool m_enabled{true};
  bool m_initialized{false};
  bool m_cleaned{false};
  bool m_bodyAttached{false};
  bool m_degradedMovement{false};

  float m_timeInState{0.0f};
  float m_timeAlive{0.0f};
  float m_lastAttackTime{0.0f};

  // Perception
  bool m_canSeePlayer{false};
  float m_perceptionTimer{0.0f}; // Counts down; refresh at <= 0
  std::optional<Vector3D> m_lastKnownPlayerPosition;
  std::optional<Vector3D> m_playerSnapshot; // Read once per tick

  // Distance tiering
  HordeEngine::DistanceTier m_tier{HordeEngine::DistanceTier::Near};
  float m_coarseAccumulator{0.0f};

  std::vector<HordeEngine::TaskHandle> m_pendingTasks;

  // Idle fidget RNG (member vars to avoid static in threaded code)
  std::mt19937 m_rng{std::random_device{}()};
  std::uniform_real_distribution<float> m_unitDist{0.0f, 1.0f};
};

#endif // AGENT_HPP
