/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "core/PopulationErrors.hpp"
#include "core/TimestepManager.hpp"
#include "managers/PopulationManager.hpp"
#include "world/HeadlessWorld.hpp"
#include <cstdlib>
#include <format>
#include <iostream>

namespace {
constexpr float TARGET_FPS = 60.0f;
constexpr float FIXED_TIMESTEP = 1.0f / 60.0f;
constexpr double ACTIVATION_DELAY_SECONDS = 2.0; // Let the first frames settle
constexpr double DEFAULT_RUN_SECONDS = 30.0;

void registerDemoAssets(HordeEngine::InMemoryAssetProvider& assets) {
    assets.addModel("zombie", 100.0f);
    assets.addAnimation("idle", 2.0f);
    assets.addAnimation("walk", 1.1f);
    assets.addAnimation("attack", 1.0f);
    assets.addAnimation("death", 1.6f);
    // No "run" clip; the animator falls back to walk
}
} // namespace

int main(int argc, char* argv[]) {
    const double runSeconds = (argc > 1) ? std::atof(argv[1]) : DEFAULT_RUN_SECONDS;

    HordeEngine::HeadlessWorld world;
    registerDemoAssets(world.getAssets());

    PopulationManager population(world.getRegistry(), world.getServices());

    try {
        HordeEngine::PopulationConfigOverrides overrides;
        overrides.maxPopulation = 120;
        overrides.initialActiveCount = 20;
        overrides.activationRate = 4;
        overrides.archetypes = {
            {"standard", 3.0f, 100.0f, 3.0f, 20.0f, 15.0f},
            {"runner", 1.0f, 60.0f, 5.0f, 10.0f, 25.0f},
            {"brute", 0.5f, 250.0f, 2.0f, 40.0f, 10.0f},
        };
        population.configure(overrides);

        population.configureSpawnAreas({
            HordeEngine::SpawnRegion::circle("graveyard", Vector3D(40.0f, 0.0f, 40.0f), 15.0f, 2.0f),
            HordeEngine::SpawnRegion::rectangle("field", Vector3D(-50.0f, 0.0f, 10.0f), 20.0f, 30.0f),
        });
    } catch (const HordeEngine::ConfigError& e) {
        GAMELOOP_CRITICAL(std::format("Invalid demo configuration: {}", e.what()));
        return 1;
    }

    const bool preloaded = population.preloadAll([](const HordeEngine::PreloadProgress& progress) {
        GAMELOOP_INFO(progress.status);
    });
    if (!preloaded) {
        GAMELOOP_CRITICAL(std::format("Preload failed: {}", population.getLastErrorMessage()));
        return 1;
    }

    world.getScheduler().scheduleOnce(ACTIVATION_DELAY_SECONDS, [&population]() {
        population.activateInitialBatch();
    });

    HordeEngine::TimestepManager timestep(TARGET_FPS, FIXED_TIMESTEP);
    double nextReport = 5.0;

    while (timestep.getSimulatedTime() < runSeconds) {
        timestep.startFrame();

        while (timestep.shouldUpdate()) {
            const float deltaTime = timestep.getUpdateDeltaTime();
            world.step(deltaTime);
            population.update(deltaTime);
        }

        if (timestep.getSimulatedTime() >= nextReport) {
            nextReport += 5.0;
            GAMELOOP_INFO(std::format(
                "t={:.1f}s active={} pending={} playerHits={} fps={:.1f}/{:.0f} frame={}ms",
                timestep.getSimulatedTime(), population.getActiveCount(),
                population.getPendingActivationCount(), world.getPlayer().getHitsTaken(),
                timestep.getCurrentFPS(), timestep.getTargetFPS(), timestep.getFrameTimeMs()));
        }

        timestep.endFrame();
    }

    std::cout << "Simulated " << timestep.getSimulatedTime() << "s: "
              << population.getActiveCount() << " active agents, "
              << world.getPlayer().getHitsTaken() << " hits on the player" << std::endl;

    population.clear();
    return 0;
}
