/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"

namespace LatticeEngine {

AABB AABB::fromCenter(const Vector2D& center, const Vector2D& halfSize) {
    return AABB(center.getX() - halfSize.getX(), center.getY() - halfSize.getY(),
                center.getX() + halfSize.getX(), center.getY() + halfSize.getY());
}

bool AABB::overlaps(const AABB& other) const {
    // Closed intervals: touching edges count
    if (x2 < other.x1 || other.x2 < x1) return false;
    if (y2 < other.y1 || other.y2 < y1) return false;
    return true;
}

} // namespace LatticeEngine
