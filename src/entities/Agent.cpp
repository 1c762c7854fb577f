/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Agent.hpp"

#include "collisions/IPhysicsService.hpp"
#include "core/Logger.hpp"
#include "core/PopulationErrors.hpp"
#include "entities/IPlayerTarget.hpp"
#include "managers/IAssetProvider.hpp"

// Agent behavior states
#include "entities/agentStates/AgentAttackState.hpp"
#include "entities/agentStates/AgentChaseState.hpp"
#include "entities/agentStates/AgentDeathState.hpp"
#include "entities/agentStates/AgentIdleState.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

namespace {
constexpr float PI = 3.14159265359f;
constexpr float TWO_PI = 6.28318530718f;

// Clips requested from the asset provider for every agent
constexpr const char *CLIP_NAMES[] = {"idle", "walk", "run", "attack", "death"};

float wrapAngle(float angle) {
  while (angle > PI) {
    angle -= TWO_PI;
  }
  while (angle < -PI) {
    angle += TWO_PI;
  }
  return angle;
}

float headingTo(const Vector3D &from, const Vector3D &to) {
  Vector3D direction = (to - from).horizontal();
  return std::atan2(direction.getX(), direction.getZ());
}
} // namespace

Agent::Agent(const HordeEngine::AgentArchetype &archetype,
             const Vector3D &startPosition, const AgentServices &services,
             const HordeEngine::AgentBehaviorConfig &config)
    : Entity(), m_archetype(archetype), m_config(config), m_services(services),
      m_health(archetype.health), m_maxHealth(archetype.health) {
  if (m_services.scheduler == nullptr) {
    AGENT_ERROR("Agent constructed without a task scheduler");
    throw std::invalid_argument("Horde Engine - Agent requires a DeferredTaskQueue");
  }

  m_position = startPosition;
  m_body.position = startPosition;
  m_visual.position = startPosition;

  setupStates();
}

Agent::~Agent() {
  // IMPORTANT: Do not call shared_from_this() here. Only the physics body
  // needs releasing; pending tasks hold weak references and expire on their own.
  detachPhysicsBody();
}

void Agent::setupStates() {
  m_stateMachine.addState(AgentStateId::Idle, std::make_unique<AgentIdleState>(*this));
  m_stateMachine.addState(AgentStateId::Chase, std::make_unique<AgentChaseState>(*this));
  m_stateMachine.addState(AgentStateId::Attack, std::make_unique<AgentAttackState>(*this));
  m_stateMachine.addState(AgentStateId::Death, std::make_unique<AgentDeathState>(*this));
}

void Agent::init() {
  if (m_initialized) {
    return;
  }

  attachPhysicsBody();
  loadModel();
  if (!m_visual.isPlaceholder()) {
    loadAnimations();
  }

  changeState(AgentStateId::Idle);
  refreshVisualTransform();
  m_initialized = true;

  AGENT_DEBUG(std::format("{} agent created at ({:.1f}, {:.1f}, {:.1f})",
                          m_archetype.id, m_position.getX(), m_position.getY(),
                          m_position.getZ()));
}

void Agent::attachPhysicsBody() {
  if (m_services.physics == nullptr) {
    AGENT_WARN("No physics service; agent integrates its own movement");
    m_degradedMovement = true;
    return;
  }

  try {
    if (m_services.physics->addBody(m_body)) {
      m_bodyAttached = true;
      return;
    }
    AGENT_ERROR("Physics service refused agent body; using degraded movement");
  } catch (const HordeEngine::PhysicsAttachError &e) {
    AGENT_ERROR(std::format("Physics attach failed: {}; using degraded movement", e.what()));
  } catch (const std::exception &e) {
    AGENT_ERROR(std::format("Physics service threw: {}; using degraded movement", e.what()));
  }
  m_degradedMovement = true;
}

void Agent::detachPhysicsBody() {
  if (!m_bodyAttached) {
    return;
  }
  m_bodyAttached = false;
  if (m_services.physics) {
    m_services.physics->removeBody(m_body);
  }
}

void Agent::loadModel() {
  if (m_services.assets == nullptr) {
    createPlaceholderVisual();
    return;
  }

  try {
    auto model = m_services.assets->getModel(m_config.modelKind);
    if (!model) {
      AGENT_ERROR(std::format("Model '{}' not found; using placeholder", m_config.modelKind));
      createPlaceholderVisual();
      return;
    }
    m_visual.model = std::move(model);
    m_visual.placeholderParts.clear();
    m_visual.scale = m_config.modelScale;
  } catch (const HordeEngine::AssetLoadError &e) {
    AGENT_ERROR(std::format("Failed to load model '{}': {}", m_config.modelKind, e.what()));
    createPlaceholderVisual();
  } catch (const std::exception &e) {
    AGENT_ERROR(std::format("Asset provider threw for model '{}': {}", m_config.modelKind,
                            e.what()));
    createPlaceholderVisual();
  }
}

void Agent::loadAnimations() {
  for (const char *name : CLIP_NAMES) {
    try {
      m_animator.addClip(name, m_services.assets->getAnimation(name));
    } catch (const HordeEngine::AssetLoadError &e) {
      AGENT_WARN(std::format("Animation '{}' unavailable: {}", name, e.what()));
    } catch (const std::exception &e) {
      AGENT_WARN(std::format("Asset provider threw for animation '{}': {}", name, e.what()));
    }
  }
}

void Agent::createPlaceholderVisual() {
  m_visual.model.reset();
  m_visual.scale = 1.0f;
  m_visual.placeholderParts = {
      {"body", Vector3D(0.5f, 1.0f, 0.3f), Vector3D(0.0f, 0.5f, 0.0f)},
      {"head", Vector3D(0.3f, 0.3f, 0.3f), Vector3D(0.0f, 1.15f, 0.0f)},
      {"leftArm", Vector3D(0.15f, 0.5f, 0.15f), Vector3D(-0.325f, 0.5f, 0.0f)},
      {"rightArm", Vector3D(0.15f, 0.5f, 0.15f), Vector3D(0.325f, 0.5f, 0.0f)},
      {"leftLeg", Vector3D(0.15f, 0.5f, 0.15f), Vector3D(-0.2f, -0.25f, 0.0f)},
      {"rightLeg", Vector3D(0.15f, 0.5f, 0.15f), Vector3D(0.2f, -0.25f, 0.0f)},
  };
}

void Agent::update(float deltaTime) {
  if (!m_enabled || !m_isAlive) {
    return;
  }

  m_timeAlive += deltaTime;
  m_timeInState += deltaTime;

  if (m_services.player) {
    m_playerSnapshot = m_services.player->getPosition();
  } else {
    m_playerSnapshot.reset();
  }

  const float distanceToPlayer =
      m_playerSnapshot ? Vector3D::distance(m_position, *m_playerSnapshot)
                       : std::numeric_limits<float>::infinity();
  m_tier = HordeEngine::classifyDistance(distanceToPlayer, m_config.farDistance,
                                         m_config.veryFarDistance);

  m_animator.apply(selectAnimation(getState(), m_tier), deltaTime);

  if (m_tier == HordeEngine::DistanceTier::Near) {
    m_coarseAccumulator = 0.0f;
    updatePerception(deltaTime);
    processStateMachine(deltaTime);
  } else {
    m_coarseAccumulator += deltaTime;
    if (m_coarseAccumulator >= m_config.coarseUpdateInterval) {
      const float step = m_coarseAccumulator;
      m_coarseAccumulator = 0.0f;
      updatePerception(step);
      processStateMachine(step);
    }
  }

  if (m_tier != HordeEngine::DistanceTier::VeryFar) {
    syncPositionFromBody(deltaTime);
  }

  refreshVisualTransform();
}

void Agent::updatePerception(float deltaTime) {
  m_perceptionTimer -= deltaTime;
  if (m_perceptionTimer > 0.0f) {
    return;
  }
  m_perceptionTimer = m_config.perceptionInterval;

  const bool previouslyVisible = m_canSeePlayer;
  m_canSeePlayer = false;

  if (!m_playerSnapshot) {
    return;
  }

  if (Vector3D::distance(m_position, *m_playerSnapshot) <= m_archetype.detectionRange) {
    m_canSeePlayer = true;
    m_lastKnownPlayerPosition = m_playerSnapshot;

    if (!previouslyVisible && getState() == AgentStateId::Idle) {
      changeState(AgentStateId::Chase);
    }
  }
}

void Agent::processStateMachine(float deltaTime) {
  if (getState() == AgentStateId::Idle && m_canSeePlayer) {
    changeState(AgentStateId::Chase);
  }
  m_stateMachine.update(deltaTime);
}

void Agent::processIdle(float deltaTime) {
  (void)deltaTime;
  if (m_unitDist(m_rng) < m_config.idleDriftChance) {
    const float nudge = (m_unitDist(m_rng) * 2.0f - 1.0f) * m_config.idleDriftMagnitude;
    m_yaw = wrapAngle(m_yaw + nudge);
  }
}

void Agent::processChase(float deltaTime) {
  if (!m_playerSnapshot) {
    return;
  }

  if (m_lastKnownPlayerPosition) {
    if (Vector3D::distance(m_position, *m_playerSnapshot) <= m_config.attackRange) {
      changeState(AgentStateId::Attack);
      return;
    }

    const float target = headingTo(m_position, *m_lastKnownPlayerPosition);
    const float diff = wrapAngle(target - wrapAngle(m_yaw));
    m_yaw = wrapAngle(m_yaw + diff * std::min(m_config.turnSpeed * deltaTime, 1.0f));

    setHorizontalVelocity(std::sin(m_yaw) * m_archetype.speed,
                          std::cos(m_yaw) * m_archetype.speed);
  }

  if (!m_canSeePlayer && m_timeInState > m_config.loseInterestTime) {
    changeState(AgentStateId::Idle);
  }
}

void Agent::processAttack(float deltaTime) {
  (void)deltaTime;
  if (!m_playerSnapshot) {
    return;
  }

  const float distanceToPlayer = Vector3D::distance(m_position, *m_playerSnapshot);
  if (distanceToPlayer > m_config.attackRange * m_config.attackLeashMultiplier) {
    changeState(AgentStateId::Chase);
    return;
  }

  faceTowards(*m_playerSnapshot);

  if (m_timeAlive - m_lastAttackTime > m_config.attackCooldown) {
    triggerAttack();
  }
}

void Agent::triggerAttack() {
  m_animator.restart();
  m_lastAttackTime = m_timeAlive;

  std::weak_ptr<Entity> weak = weak_from_this();

  trackTask(m_services.scheduler->scheduleOnce(m_config.hitDelay, [weak]() {
    if (auto self = weak.lock()) {
      static_cast<Agent &>(*self).resolveHit();
    }
  }));

  trackTask(m_services.scheduler->scheduleOnce(m_config.recoveryDelay, [weak]() {
    if (auto self = weak.lock()) {
      static_cast<Agent &>(*self).resolveRecovery();
    }
  }));

  AGENT_DEBUG(std::format("Agent {} swings", m_id));
}

void Agent::resolveHit() {
  if (!m_isAlive || !m_enabled || getState() != AgentStateId::Attack ||
      m_services.player == nullptr) {
    return;
  }

  // Live position, not the tick snapshot
  const Vector3D playerPosition = m_services.player->getPosition();
  if (Vector3D::distance(m_position, playerPosition) <= m_config.attackRange) {
    m_services.player->takeDamage(m_archetype.damage, *this);
  }
}

void Agent::resolveRecovery() {
  if (m_isAlive && getState() == AgentStateId::Attack) {
    changeState(AgentStateId::Chase);
  }
}

void Agent::trackTask(HordeEngine::TaskHandle handle) {
  auto *scheduler = m_services.scheduler;
  m_pendingTasks.erase(
      std::remove_if(m_pendingTasks.begin(), m_pendingTasks.end(),
                     [scheduler](HordeEngine::TaskHandle h) { return !scheduler->isPending(h); }),
      m_pendingTasks.end());
  m_pendingTasks.push_back(handle);
}

void Agent::cancelPendingTasks() {
  for (HordeEngine::TaskHandle handle : m_pendingTasks) {
    m_services.scheduler->cancel(handle);
  }
  m_pendingTasks.clear();
}

size_t Agent::getPendingTaskCount() const {
  return static_cast<size_t>(
      std::count_if(m_pendingTasks.begin(), m_pendingTasks.end(),
                    [this](HordeEngine::TaskHandle h) { return m_services.scheduler->isPending(h); }));
}

void Agent::syncPositionFromBody(float deltaTime) {
  if (m_bodyAttached) {
    m_position = m_body.position;
    m_velocity = m_body.velocity;
    return;
  }

  // Degraded movement: integrate our own velocity
  m_position += m_velocity * deltaTime;
  m_body.position = m_position;
}

void Agent::refreshVisualTransform() {
  m_visual.position = m_position;
  m_visual.yaw = m_yaw;
}

void Agent::faceTowards(const Vector3D &target) {
  m_yaw = headingTo(m_position, target);
}

void Agent::setHorizontalVelocity(float x, float z) {
  m_body.velocity.setX(x);
  m_body.velocity.setZ(z);
  m_velocity = m_body.velocity;
}

void Agent::zeroHorizontalVelocity() {
  setHorizontalVelocity(0.0f, 0.0f);
}

void Agent::markDead() {
  m_isAlive = false;
  m_body.velocity = Vector3D(0.0f, 0.0f, 0.0f);
  m_velocity = m_body.velocity;
}

void Agent::setPosition(const Vector3D &position) {
  m_position = position;
  m_body.position = position;
  refreshVisualTransform();
}

void Agent::setVelocity(const Vector3D &velocity) {
  m_body.velocity = velocity;
  m_velocity = velocity;
}

bool Agent::canAttackTarget() const {
  if (!m_isAlive || m_services.player == nullptr) {
    return false;
  }
  return Vector3D::distance(m_position, m_services.player->getPosition()) <=
         m_config.attackRange;
}

void Agent::changeState(AgentStateId newState) {
  if (m_stateMachine.hasCurrentState()) {
    const AgentStateId current = getState();
    if (current == newState || current == AgentStateId::Death) {
      return;
    }
    AGENT_DEBUG(std::format("Agent {} state: {} -> {}", m_id, toString(current),
                            toString(newState)));
  }

  m_timeInState = 0.0f;
  m_stateMachine.setState(newState);
}

void Agent::takeDamage(float amount) {
  m_health -= amount;

  if (m_health <= 0.0f && m_isAlive) {
    changeState(AgentStateId::Death);
  }
}

void Agent::clean() {
  if (m_cleaned) {
    return;
  }
  m_cleaned = true;

  cancelPendingTasks();
  detachPhysicsBody();
  m_animator.clearClips();
  m_visual.model.reset();
  m_visual.placeholderParts.clear();
  m_enabled = false;
}
