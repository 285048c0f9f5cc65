/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include "utils/Vector2D.hpp"

namespace LatticeEngine {

/**
 * @brief Axis-aligned rectangle stored by its edges (y grows downwards)
 *
 * Edges are inclusive: two boxes that share an edge overlap, and a
 * zero-size box still occupies its point.
 */
struct AABB {
    float x1{0.0f}; // left
    float y1{0.0f}; // top
    float x2{0.0f}; // right
    float y2{0.0f}; // bottom

    AABB() = default;
    AABB(float left, float top, float right, float bottom)
        : x1(left), y1(top), x2(right), y2(bottom) {}

    static AABB fromCenter(const Vector2D& center, const Vector2D& halfSize);

    float left() const { return x1; }
    float top() const { return y1; }
    float right() const { return x2; }
    float bottom() const { return y2; }
    float width() const { return x2 - x1; }
    float height() const { return y2 - y1; }

    Vector2D topLeft() const { return Vector2D(x1, y1); }
    Vector2D center() const { return Vector2D((x1 + x2) * 0.5f, (y1 + y2) * 0.5f); }
    Vector2D size() const { return Vector2D(width(), height()); }

    bool isValid() const { return x1 <= x2 && y1 <= y2; }

    bool overlaps(const AABB& other) const;

    bool operator==(const AABB& other) const = default;
};

} // namespace LatticeEngine

#endif // AABB_HPP
