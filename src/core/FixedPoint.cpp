/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/FixedPoint.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace LatticeEngine {

FrameScaler::FrameScaler(double nominalFrameSeconds)
    : m_nominalFrameSeconds(1.0 / 60.0) {
    setNominalFrameSeconds(nominalFrameSeconds);
}

void FrameScaler::setNominalFrameSeconds(double nominalFrameSeconds) {
    if (!(nominalFrameSeconds > 0.0)) {
        SIMSTATE_ERROR(std::format("Invalid nominal frame duration: {}", nominalFrameSeconds));
        throw std::invalid_argument(
            "Lattice Engine - Nominal frame duration must be positive");
    }
    m_nominalFrameSeconds = nominalFrameSeconds;
    m_carry = 0.0;
}

Frac::Value FrameScaler::convert(double deltaSeconds) {
    if (!(deltaSeconds > 0.0)) {
        return 0;
    }

    // Work in fixed-point units so the carried remainder is always below one unit
    double units = (deltaSeconds / m_nominalFrameSeconds) *
                   static_cast<double>(Frac::UNIT) + m_carry;
    // Absorb floating error that lands a hair below a whole unit
    double whole = std::floor(units + 1e-6);
    m_carry = std::max(0.0, units - whole);
    return static_cast<Frac::Value>(whole);
}

} // namespace LatticeEngine
