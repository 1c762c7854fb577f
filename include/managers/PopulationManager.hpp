/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POPULATION_MANAGER_HPP
#define POPULATION_MANAGER_HPP

/**
 * @file PopulationManager.hpp
 * @brief Lifecycle of the hostile agent population
 *
 * Preload builds the whole roster up front (disabled) so agent creation cost
 * is paid behind a loading screen. Activation then brings agents online in
 * small batches on a DeferredTaskQueue timer so hundreds of agents never
 * start in the same frame.
 *
 * Agents update themselves through the host entity registry; this manager
 * only adds, prunes and removes them.
 *
 * Threading: roster mutation is serialized by an internal mutex. The mutex
 * is never held while calling into the host (registry, progress callback).
 */

#include "ai/PopulationCatalog.hpp"
#include "core/DeferredTaskQueue.hpp"
#include "core/PopulationErrors.hpp"
#include "entities/Agent.hpp"
#include "managers/PopulationConfig.hpp"
#include "world/SpatialSampler.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class IEntityRegistry;

class PopulationManager {
public:
  using ProgressCallback = std::function<void(const HordeEngine::PreloadProgress &)>;

  static constexpr int PRELOAD_YIELD_INTERVAL = 10; // Agents between progress callbacks

  /**
   * @throws std::invalid_argument if services.scheduler is null
   */
  PopulationManager(IEntityRegistry &registry, const AgentServices &services,
                    const HordeEngine::AgentBehaviorConfig &behavior =
                        HordeEngine::AgentBehaviorConfig{});
  PopulationManager(IEntityRegistry &registry, const AgentServices &services,
                    uint32_t seed,
                    const HordeEngine::AgentBehaviorConfig &behavior =
                        HordeEngine::AgentBehaviorConfig{});
  ~PopulationManager();

  PopulationManager(const PopulationManager &) = delete;
  PopulationManager &operator=(const PopulationManager &) = delete;

  /**
   * @brief Merge settings onto the current configuration
   * @throws ConfigError for activationRate < 1, activationIntervalMs <= 0,
   *         negative counts, or an invalid archetype list. Nothing is
   *         applied on failure.
   */
  void configure(const HordeEngine::PopulationConfigOverrides &overrides);

  // Delegates to SpatialSampler::configure
  void configureSpawnAreas(const std::vector<HordeEngine::SpawnRegion> &regions);

  // Delegates to PopulationCatalog::registerArchetypes
  void registerArchetypes(const std::vector<HordeEngine::AgentArchetype> &archetypes);

  /**
   * @brief Build maxPopulation disabled agents
   *
   * The callback runs every PRELOAD_YIELD_INTERVAL agents and once at the
   * end so the host can pump its loop and paint progress.
   *
   * @return false if there is no player to spawn around or an agent could
   *         not be built; getLastError() then holds the reason and the
   *         partial roster has been discarded
   */
  bool preloadAll(const ProgressCallback &onProgress = nullptr);

  /**
   * @brief Enable the first initialActiveCount preloaded agents and start
   *        staged activation for the rest
   * @return Number of agents activated now
   */
  size_t activateInitialBatch();

  /**
   * @brief Prune dead agents from the active roster and the registry
   *
   * No-op while disabled or before preload completes.
   */
  void update(float deltaTime);

  /**
   * @brief Create and activate one agent outside the staged pipeline
   *
   * Unknown or absent archetype ids use the default archetype.
   * @return The new agent, or nullptr if construction failed
   */
  AgentPtr spawnOne(const Vector3D &position,
                    const std::optional<std::string> &archetypeId = std::nullopt);

  /**
   * @brief Deregister and clean every agent, stop staged activation
   */
  void clear();

  void setEnabled(bool enabled) { m_enabled = enabled; }
  bool isEnabled() const { return m_enabled; }

  const HordeEngine::PopulationConfig &getConfig() const { return m_config; }
  const HordeEngine::PopulationCatalog &getCatalog() const { return m_catalog; }
  const HordeEngine::SpatialSampler &getSampler() const { return m_sampler; }

  bool isPreloadComplete() const { return m_preloadComplete; }
  bool isStagedActivationRunning() const;
  const HordeEngine::PreloadProgress &getPreloadProgress() const { return m_progress; }

  size_t getActiveCount() const;
  // Agents built by the last preload
  size_t getPreloadedCount() const;
  // Preloaded agents still waiting for activation
  size_t getPendingActivationCount() const;
  std::vector<AgentPtr> getActiveAgents() const;

  HordeEngine::PopulationErrorCode getLastError() const { return m_lastError; }
  const std::string &getLastErrorMessage() const { return m_lastErrorMessage; }

private:
  size_t activateBatch(size_t maxCount);
  void activate(const AgentPtr &agent);
  void onStagedActivation();
  void cancelStagedActivation();
  void reportProgress(const ProgressCallback &onProgress, int created, int total);
  // Drops agents left by an interrupted preload so a retry starts from zero
  void discardPreloaded();
  void setError(const HordeEngine::PopulationError &error);

  IEntityRegistry &m_registry;
  AgentServices m_services;
  HordeEngine::AgentBehaviorConfig m_behavior;

  HordeEngine::PopulationConfig m_config;
  HordeEngine::PopulationCatalog m_catalog;
  HordeEngine::SpatialSampler m_sampler;

  mutable std::mutex m_rosterMutex;
  std::vector<AgentPtr> m_active;
  std::deque<AgentPtr> m_preloaded; // Front is activated first
  size_t m_preloadedTotal{0};

  HordeEngine::TaskHandle m_stagedTask{HordeEngine::INVALID_TASK_HANDLE};
  bool m_enabled{true};
  bool m_preloadComplete{false};
  HordeEngine::PreloadProgress m_progress;

  HordeEngine::PopulationErrorCode m_lastError{HordeEngine::PopulationErrorCode::None};
  std::string m_lastErrorMessage;
};

#endif // POPULATION_MANAGER_HPP
