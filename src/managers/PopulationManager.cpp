/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/PopulationManager.hpp"
#include "core/Logger.hpp"
#include "entities/IEntityRegistry.hpp"
#include "entities/IPlayerTarget.hpp"
#include <algorithm>
#include <format>
#include <iterator>
#include <stdexcept>

PopulationManager::PopulationManager(IEntityRegistry &registry,
                                     const AgentServices &services,
                                     const HordeEngine::AgentBehaviorConfig &behavior)
    : m_registry(registry), m_services(services), m_behavior(behavior) {
  if (m_services.scheduler == nullptr) {
    POPULATION_CRITICAL("PopulationManager requires a DeferredTaskQueue");
    throw std::invalid_argument("Horde Engine - PopulationManager requires a DeferredTaskQueue");
  }
}

PopulationManager::PopulationManager(IEntityRegistry &registry,
                                     const AgentServices &services, uint32_t seed,
                                     const HordeEngine::AgentBehaviorConfig &behavior)
    : m_registry(registry), m_services(services), m_behavior(behavior),
      m_catalog(seed), m_sampler(seed + 1) {
  if (m_services.scheduler == nullptr) {
    POPULATION_CRITICAL("PopulationManager requires a DeferredTaskQueue");
    throw std::invalid_argument("Horde Engine - PopulationManager requires a DeferredTaskQueue");
  }
}

PopulationManager::~PopulationManager() {
  // The staged task captures 'this'
  cancelStagedActivation();
}

void PopulationManager::setError(const HordeEngine::PopulationError &error) {
  m_lastError = error.code();
  m_lastErrorMessage = error.what();
}

void PopulationManager::configure(const HordeEngine::PopulationConfigOverrides &overrides) {
  HordeEngine::PopulationConfig merged = m_config;
  if (overrides.maxPopulation) merged.maxPopulation = *overrides.maxPopulation;
  if (overrides.preloadAtStart) merged.preloadAtStart = *overrides.preloadAtStart;
  if (overrides.initialActiveCount) merged.initialActiveCount = *overrides.initialActiveCount;
  if (overrides.activationRate) merged.activationRate = *overrides.activationRate;
  if (overrides.activationIntervalMs) merged.activationIntervalMs = *overrides.activationIntervalMs;

  try {
    if (merged.activationRate < 1) {
      throw HordeEngine::ConfigError(
          std::format("activationRate must be at least 1 (got {})", merged.activationRate));
    }
    if (merged.activationIntervalMs <= 0.0) {
      throw HordeEngine::ConfigError(std::format(
          "activationIntervalMs must be positive (got {})", merged.activationIntervalMs));
    }
    if (merged.maxPopulation < 0 || merged.initialActiveCount < 0) {
      throw HordeEngine::ConfigError("Population counts must not be negative");
    }
    if (!overrides.archetypes.empty()) {
      m_catalog.registerArchetypes(overrides.archetypes);
    }
  } catch (const HordeEngine::ConfigError &e) {
    POPULATION_ERROR(std::format("Configuration rejected: {}", e.what()));
    setError(e);
    throw;
  }

  m_config = merged;
  POPULATION_INFO(std::format(
      "Configured: maxPopulation={}, preloadAtStart={}, initialActiveCount={}, "
      "activationRate={}, activationIntervalMs={}",
      m_config.maxPopulation, m_config.preloadAtStart, m_config.initialActiveCount,
      m_config.activationRate, m_config.activationIntervalMs));
}

void PopulationManager::configureSpawnAreas(const std::vector<HordeEngine::SpawnRegion> &regions) {
  m_sampler.configure(regions);
}

void PopulationManager::registerArchetypes(const std::vector<HordeEngine::AgentArchetype> &archetypes) {
  m_catalog.registerArchetypes(archetypes);
}

bool PopulationManager::preloadAll(const ProgressCallback &onProgress) {
  if (m_services.player == nullptr) {
    setError(HordeEngine::PreloadError("Cannot preload agents without a player target"));
    POPULATION_ERROR(m_lastErrorMessage);
    return false;
  }

  if (m_preloadComplete) {
    POPULATION_WARN("Preload already complete; call clear() before preloading again");
    return true;
  }

  const int total = m_config.maxPopulation;
  POPULATION_INFO(std::format("Preloading {} agents...", total));

  for (int i = 0; i < total; ++i) {
    AgentPtr agent;
    try {
      const HordeEngine::AgentArchetype archetype = m_catalog.drawRandom();
      const Vector3D spawnPoint = m_sampler.sample(m_services.player->getPosition());
      agent = Agent::create(archetype, spawnPoint, m_services, m_behavior);
    } catch (const std::exception &e) {
      setError(HordeEngine::PreloadError(
          std::format("Agent construction failed after {} of {}: {}", i, total, e.what())));
      POPULATION_ERROR(m_lastErrorMessage);
      discardPreloaded();
      return false;
    }
    agent->setEnabled(false);

    {
      std::lock_guard<std::mutex> lock(m_rosterMutex);
      m_preloaded.push_back(agent);
      ++m_preloadedTotal;
    }

    const int created = i + 1;
    if (created % PRELOAD_YIELD_INTERVAL == 0 && created != total) {
      reportProgress(onProgress, created, total);
    }
  }

  m_preloadComplete = true;
  reportProgress(onProgress, total, total);
  POPULATION_INFO(std::format("Preloaded {} agents successfully", total));
  return true;
}

void PopulationManager::discardPreloaded() {
  std::deque<AgentPtr> preloaded;
  {
    std::lock_guard<std::mutex> lock(m_rosterMutex);
    preloaded.swap(m_preloaded);
    m_preloadedTotal = 0;
  }
  for (const auto &agent : preloaded) {
    agent->clean();
  }
  if (!preloaded.empty()) {
    POPULATION_WARN(std::format("Discarded {} partially preloaded agents", preloaded.size()));
  }
}

void PopulationManager::reportProgress(const ProgressCallback &onProgress, int created, int total) {
  m_progress.created = created;
  m_progress.total = total;
  m_progress.percent =
      total > 0 ? 100.0f * static_cast<float>(created) / static_cast<float>(total) : 100.0f;
  m_progress.status = (created >= total)
                          ? std::string("Agents ready! Starting game...")
                          : std::format("Preparing agents... {}%",
                                        static_cast<int>(m_progress.percent));

  if (onProgress) {
    onProgress(m_progress);
  }
}

size_t PopulationManager::activateInitialBatch() {
  if (!m_preloadComplete) {
    POPULATION_WARN("activateInitialBatch called before preload completed");
  }

  const size_t activated =
      activateBatch(static_cast<size_t>(std::max(m_config.initialActiveCount, 0)));
  POPULATION_INFO(std::format("Activated initial batch of {} agents", activated));

  cancelStagedActivation();
  if (getPendingActivationCount() > 0) {
    const double intervalSeconds = m_config.activationIntervalMs / 1000.0;
    m_stagedTask = m_services.scheduler->scheduleRepeating(
        intervalSeconds, [this]() { onStagedActivation(); });
    POPULATION_DEBUG(std::format("Staged activation: {} agents every {:.0f} ms",
                                 m_config.activationRate, m_config.activationIntervalMs));
  }
  return activated;
}

void PopulationManager::onStagedActivation() {
  const size_t activated = activateBatch(static_cast<size_t>(m_config.activationRate));
  POPULATION_DEBUG(std::format("Staged activation enabled {} agents ({} active)", activated,
                               getActiveCount()));

  if (getPendingActivationCount() == 0) {
    cancelStagedActivation();
    POPULATION_INFO("All preloaded agents are active");
  }
}

size_t PopulationManager::activateBatch(size_t maxCount) {
  std::vector<AgentPtr> batch;
  {
    std::lock_guard<std::mutex> lock(m_rosterMutex);
    const size_t count = std::min(maxCount, m_preloaded.size());
    batch.reserve(count);
    for (size_t i = 0; i < count; ++i) {
      batch.push_back(std::move(m_preloaded.front()));
      m_preloaded.pop_front();
    }
  }

  for (const auto &agent : batch) {
    activate(agent);
  }
  return batch.size();
}

void PopulationManager::activate(const AgentPtr &agent) {
  agent->setEnabled(true);
  agent->assignID(m_registry.addEntity(agent));

  std::lock_guard<std::mutex> lock(m_rosterMutex);
  m_active.push_back(agent);
}

void PopulationManager::cancelStagedActivation() {
  if (m_stagedTask != HordeEngine::INVALID_TASK_HANDLE) {
    m_services.scheduler->cancel(m_stagedTask);
    m_stagedTask = HordeEngine::INVALID_TASK_HANDLE;
  }
}

bool PopulationManager::isStagedActivationRunning() const {
  return m_stagedTask != HordeEngine::INVALID_TASK_HANDLE &&
         m_services.scheduler->isPending(m_stagedTask);
}

void PopulationManager::update(float deltaTime) {
  (void)deltaTime;
  if (!m_enabled || !m_preloadComplete) {
    return;
  }

  std::vector<AgentPtr> dead;
  {
    std::lock_guard<std::mutex> lock(m_rosterMutex);
    auto firstDead = std::stable_partition(m_active.begin(), m_active.end(),
                                           [](const AgentPtr &agent) { return agent->isAlive(); });
    dead.assign(std::make_move_iterator(firstDead), std::make_move_iterator(m_active.end()));
    m_active.erase(firstDead, m_active.end());
  }

  for (const auto &agent : dead) {
    m_registry.removeEntity(agent);
    agent->clean();
  }

  if (!dead.empty()) {
    POPULATION_DEBUG(std::format("Pruned {} dead agents", dead.size()));
  }
}

AgentPtr PopulationManager::spawnOne(const Vector3D &position,
                                     const std::optional<std::string> &archetypeId) {
  const HordeEngine::AgentArchetype archetype = m_catalog.resolveArchetype(archetypeId);

  AgentPtr agent;
  try {
    agent = Agent::create(archetype, position, m_services, m_behavior);
  } catch (const std::exception &e) {
    POPULATION_ERROR(std::format("Failed to spawn '{}' agent: {}", archetype.id, e.what()));
    return nullptr;
  }

  activate(agent);
  POPULATION_DEBUG(std::format("Spawned {} agent at ({:.1f}, {:.1f}, {:.1f})", archetype.id,
                               position.getX(), position.getY(), position.getZ()));
  return agent;
}

void PopulationManager::clear() {
  cancelStagedActivation();

  std::vector<AgentPtr> active;
  std::deque<AgentPtr> preloaded;
  {
    std::lock_guard<std::mutex> lock(m_rosterMutex);
    active.swap(m_active);
    preloaded.swap(m_preloaded);
    m_preloadedTotal = 0;
  }
  m_preloadComplete = false;
  m_progress = HordeEngine::PreloadProgress{};

  for (const auto &agent : active) {
    m_registry.removeEntity(agent);
    agent->clean();
  }
  for (const auto &agent : preloaded) {
    agent->clean();
  }

  POPULATION_INFO(std::format("Cleared {} active and {} preloaded agents", active.size(),
                              preloaded.size()));
}

size_t PopulationManager::getActiveCount() const {
  std::lock_guard<std::mutex> lock(m_rosterMutex);
  return m_active.size();
}

size_t PopulationManager::getPreloadedCount() const {
  std::lock_guard<std::mutex> lock(m_rosterMutex);
  return m_preloadedTotal;
}

size_t PopulationManager::getPendingActivationCount() const {
  std::lock_guard<std::mutex> lock(m_rosterMutex);
  return m_preloaded.size();
}

std::vector<AgentPtr> PopulationManager::getActiveAgents() const {
  std::lock_guard<std::mutex> lock(m_rosterMutex);
  return m_active;
}
