/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

namespace LatticeEngine {

/**
 * @brief Tunables of a SimulationState and the host loop driving it
 *
 * fromSettings() reads them from SettingsManager:
 *   simulation.chunk_width, simulation.chunk_height, simulation.time_factor,
 *   simulation.nominal_frame_seconds, host.target_fps, host.window_width,
 *   host.window_height
 * Invalid values are logged and replaced by the defaults below.
 */
struct SimulationConfig {
    float chunkWidth{256.0f};
    float chunkHeight{256.0f};
    double timeFactor{1.0}; // ticks per nominal frame
    double nominalFrameSeconds{1.0 / 60.0};

    int targetFPS{60};
    int windowWidth{1280};
    int windowHeight{720};

    static SimulationConfig fromSettings();
};

} // namespace LatticeEngine

#endif // SIMULATION_CONFIG_HPP
