/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FIXED_POINT_HPP
#define FIXED_POINT_HPP

#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace LatticeEngine {

/**
 * @brief Fixed-point time arithmetic used by the simulation clock.
 *
 * A value of Frac::UNIT is one whole tick. Time factors, leftover time,
 * animation speeds and frame durations are all expressed in this unit so
 * that tick counts stay deterministic regardless of frame-rate jitter.
 */
namespace Frac {

using Value = int64_t;

inline constexpr int BITS = 12;
inline constexpr Value UNIT = Value{1} << BITS;

/// Multiplies two fixed-point values, rounding toward negative infinity
constexpr Value mul(Value a, Value b) noexcept {
    return (a * b) >> BITS;
}

/**
 * @brief Multiplies like mul() but keeps the bits mul() would drop
 *
 * remainder holds the fraction of a unit left from earlier products and is
 * updated in place, staying within [0, UNIT). Summing a run of products
 * this way loses nothing, so many small products add up to one large one.
 */
constexpr Value mulCarry(Value a, Value b, Value& remainder) noexcept {
    const Value full = a * b + remainder;
    remainder = full & (UNIT - 1);
    return full >> BITS;
}

constexpr Value div(Value a, Value b) {
    if (b == 0) {
        throw std::invalid_argument("Lattice Engine - Fixed-point division by zero");
    }
    return (a * UNIT) / b;
}

/// Whole ticks contained in a non-negative fixed-point value
constexpr Value wholeUnits(Value v) noexcept {
    return v >> BITS;
}

constexpr Value fromInt(int64_t v) noexcept {
    return v * UNIT;
}

inline Value fromDouble(double v) {
    return static_cast<Value>(std::floor(v * static_cast<double>(UNIT)));
}

inline double toDouble(Value v) {
    return static_cast<double>(v) / static_cast<double>(UNIT);
}

} // namespace Frac

/**
 * @brief Converts wall-clock frame deltas into fixed-point frame scales.
 *
 * A delta equal to the nominal frame duration yields exactly Frac::UNIT.
 * The sub-unit rounding remainder is carried into the next conversion, so
 * a run of small frames adds up to the same scale as one large frame.
 */
class FrameScaler {
public:
    explicit FrameScaler(double nominalFrameSeconds = 1.0 / 60.0);

    /**
     * @brief Converts one frame delta into a frame scale
     * @param deltaSeconds Wall-clock frame duration, negative values count as 0
     * @return Fixed-point number of nominal frames covered by deltaSeconds
     */
    Frac::Value convert(double deltaSeconds);

    void setNominalFrameSeconds(double nominalFrameSeconds);
    double getNominalFrameSeconds() const { return m_nominalFrameSeconds; }

    void reset() { m_carry = 0.0; }

private:
    double m_nominalFrameSeconds;
    double m_carry{0.0}; // unconverted fraction of a fixed-point unit
};

} // namespace LatticeEngine

#endif // FIXED_POINT_HPP
