/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SimulationConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <format>

namespace LatticeEngine {

SimulationConfig SimulationConfig::fromSettings() {
    const auto& settings = SettingsManager::Instance();
    const SimulationConfig defaults;
    SimulationConfig config;

    config.chunkWidth = settings.get<float>("simulation", "chunk_width", defaults.chunkWidth);
    config.chunkHeight = settings.get<float>("simulation", "chunk_height", defaults.chunkHeight);
    if (!(config.chunkWidth > 0.0f) || !(config.chunkHeight > 0.0f)) {
        SETTINGS_WARNING(std::format("Ignoring non-positive chunk size {}x{}",
                                     config.chunkWidth, config.chunkHeight));
        config.chunkWidth = defaults.chunkWidth;
        config.chunkHeight = defaults.chunkHeight;
    }

    config.timeFactor = settings.get<float>("simulation", "time_factor",
                                            static_cast<float>(defaults.timeFactor));
    if (config.timeFactor < 0.0) {
        SETTINGS_WARNING(std::format("Ignoring negative time factor {}", config.timeFactor));
        config.timeFactor = defaults.timeFactor;
    }

    config.nominalFrameSeconds = settings.get<float>(
        "simulation", "nominal_frame_seconds", static_cast<float>(defaults.nominalFrameSeconds));
    if (!(config.nominalFrameSeconds > 0.0)) {
        SETTINGS_WARNING(std::format("Ignoring non-positive nominal frame duration {}",
                                     config.nominalFrameSeconds));
        config.nominalFrameSeconds = defaults.nominalFrameSeconds;
    }

    config.targetFPS = settings.get<int>("host", "target_fps", defaults.targetFPS);
    if (config.targetFPS <= 0) {
        SETTINGS_WARNING(std::format("Ignoring non-positive target FPS {}", config.targetFPS));
        config.targetFPS = defaults.targetFPS;
    }
    config.windowWidth = settings.get<int>("host", "window_width", defaults.windowWidth);
    config.windowHeight = settings.get<int>("host", "window_height", defaults.windowHeight);

    return config;
}

} // namespace LatticeEngine
