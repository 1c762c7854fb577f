/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>
#include <cstdint>

namespace HordeEngine {

/**
 * TimestepManager drives the headless simulation loop.
 *
 * Updates always use a fixed timestep so agent perception, combat timers
 * and staged activation behave the same on every machine. Frame pacing is
 * done in software with SDL_DelayPrecise since there is no VSync to lean on.
 */
class TimestepManager {
public:
    /**
     * Constructor
     * @param targetFPS Target loop iterations per second (e.g., 60.0f)
     * @param fixedTimestep Fixed timestep for updates in seconds (e.g., 1.0f/60.0f)
     */
    explicit TimestepManager(float targetFPS = 60.0f, float fixedTimestep = 1.0f/60.0f);

    /**
     * Call this at the start of each frame
     */
    void startFrame();

    /**
     * Returns true if an update should be performed with fixed timestep.
     * May return true multiple times per frame for catch-up.
     */
    bool shouldUpdate();

    /**
     * Gets the fixed delta time for updates.
     * @return fixed timestep in seconds
     */
    float getUpdateDeltaTime() const { return m_fixedTimestep; }

    /**
     * Call this at the end of each frame. Sleeps until the target frame time has elapsed.
     */
    void endFrame() const;

    float getCurrentFPS() const { return m_currentFPS; }
    float getTargetFPS() const { return m_targetFPS; }
    uint32_t getFrameTimeMs() const { return m_lastFrameTimeMs; }

    /**
     * Total simulated time in seconds (sum of fixed steps handed out)
     */
    double getSimulatedTime() const { return m_simulatedTime; }

private:
    float m_targetFPS;
    float m_fixedTimestep;
    float m_targetFrameTime;

    std::chrono::high_resolution_clock::time_point m_frameStart;
    std::chrono::high_resolution_clock::time_point m_lastFrameTime;

    double m_accumulator{0.0};
    static constexpr double MAX_ACCUMULATOR = 0.25; // Spiral-of-death clamp
    double m_simulatedTime{0.0};

    uint32_t m_lastFrameTimeMs{0};
    double m_lastDeltaSeconds{0.0};
    float m_currentFPS{0.0f};
    float m_smoothingAlpha{0.03f};   // EMA smoothing factor
    bool m_firstFrame{true};

    void updateFPS();
};

} // namespace HordeEngine

#endif // TIMESTEP_MANAGER_HPP
