/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include <SDL3/SDL.h>
#include <algorithm>

TimestepManager::TimestepManager(float targetFPS, double maxDeltaSeconds)
    : m_targetFPS(targetFPS > 0.0f ? targetFPS : 60.0f)
    , m_targetFrameTime(1.0f / m_targetFPS)
    , m_maxDeltaSeconds(maxDeltaSeconds)
{
    auto currentTime = std::chrono::high_resolution_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}

void TimestepManager::startFrame() {
    auto currentTime = std::chrono::high_resolution_clock::now();
    m_frameStart = currentTime;

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameTime = currentTime;
        m_deltaSeconds = 0.0;
        return;
    }

    auto deltaNs = std::chrono::duration_cast<std::chrono::nanoseconds>(currentTime - m_lastFrameTime);
    m_lastFrameTime = currentTime;

    const double rawDelta = static_cast<double>(deltaNs.count()) / 1e9;
    m_lastFrameTimeMs = static_cast<uint32_t>(rawDelta * 1000.0);
    m_deltaSeconds = std::min(rawDelta, m_maxDeltaSeconds);

    updateFPS(rawDelta);
}

void TimestepManager::endFrame() {
    limitFrameRate();
}

bool TimestepManager::isFrameTimeExcessive() const {
    return m_lastFrameTimeMs > static_cast<uint32_t>(m_targetFrameTime * 2000.0f);
}

void TimestepManager::setTargetFPS(float fps) {
    if (fps > 0.0f) {
        m_targetFPS = fps;
        m_targetFrameTime = 1.0f / fps;
    }
}

void TimestepManager::reset() {
    m_firstFrame = true;
    m_deltaSeconds = 0.0;
    m_currentFPS = 0.0f;

    auto currentTime = std::chrono::high_resolution_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}

void TimestepManager::updateFPS(double rawDeltaSeconds) {
    if (rawDeltaSeconds > 0.0) {
        float instantFPS = static_cast<float>(1.0 / rawDeltaSeconds);
        instantFPS = std::clamp(instantFPS, 0.1f, 1000.0f);

        if (m_currentFPS <= 0.0f) {
            m_currentFPS = instantFPS;
        } else {
            m_currentFPS = m_smoothingAlpha * instantFPS + (1.0f - m_smoothingAlpha) * m_currentFPS;
        }
    }
}

void TimestepManager::limitFrameRate() const {
    // With VSync, SDL_RenderPresent() paces the loop
    if (!m_usingSoftwareFrameLimiting) {
        return;
    }

    int64_t targetFrameNs = static_cast<int64_t>(m_targetFrameTime * 1e9);
    auto targetEndTime = m_frameStart + std::chrono::nanoseconds(targetFrameNs);

    auto now = std::chrono::high_resolution_clock::now();
    auto remainingNs = std::chrono::duration_cast<std::chrono::nanoseconds>(targetEndTime - now);

    if (remainingNs.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remainingNs.count()));
    }
}
