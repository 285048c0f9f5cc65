/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>
#include <cstdint>

/**
 * TimestepManager measures wall-clock frame time for the host loop.
 *
 * Simulation states turn the measured delta into fixed-point ticks
 * themselves, so there is no update accumulator here: each frame yields one
 * clamped delta, an FPS estimate, and an optional software frame cap.
 */
class TimestepManager {
public:
    /**
     * @param targetFPS Frame cap used when software limiting is on
     * @param maxDeltaSeconds Longest delta reported, so a stall does not
     *        flood the simulation with catch-up ticks
     */
    explicit TimestepManager(float targetFPS = 60.0f, double maxDeltaSeconds = 0.25);

    // Call at the start of each frame
    void startFrame();

    // Call at the end of each frame; sleeps when software limiting is on
    void endFrame();

    // Seconds since the previous startFrame(), clamped; 0 on the first frame
    double getDeltaSeconds() const { return m_deltaSeconds; }

    float getCurrentFPS() const { return m_currentFPS; }
    float getTargetFPS() const { return m_targetFPS; }
    uint32_t getFrameTimeMs() const { return m_lastFrameTimeMs; }

    // More than twice the target frame time
    bool isFrameTimeExcessive() const;

    void setTargetFPS(float fps);

    void setSoftwareFrameLimiting(bool useSoftwareLimiting) { m_usingSoftwareFrameLimiting = useSoftwareLimiting; }
    bool isUsingSoftwareFrameLimiting() const { return m_usingSoftwareFrameLimiting; }

    // Reset timing state (useful when pausing/unpausing)
    void reset();

private:
    void updateFPS(double rawDeltaSeconds);
    void limitFrameRate() const;

    float m_targetFPS;
    float m_targetFrameTime; // 1 / targetFPS
    double m_maxDeltaSeconds;

    std::chrono::high_resolution_clock::time_point m_frameStart;
    std::chrono::high_resolution_clock::time_point m_lastFrameTime;

    double m_deltaSeconds{0.0};
    uint32_t m_lastFrameTimeMs{0};
    float m_currentFPS{0.0f};           // EMA smoothed
    float m_smoothingAlpha{0.03f};
    bool m_firstFrame{true};
    bool m_usingSoftwareFrameLimiting{false};
};

#endif // TIMESTEP_MANAGER_HPP
