/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HITBOX_HPP
#define HITBOX_HPP

#include "collisions/AABB.hpp"
#include "sim/SimHandles.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace LatticeEngine {

/**
 * @brief Why a shape is indexed
 *
 * Locator: rendering order (bucketed by draw layer)
 * Overlap: sensor queries
 * Solid:   collision resolution
 */
enum class HitboxRole : uint8_t {
    Locator = 0,
    Overlap = 1,
    Solid = 2
};

constexpr size_t HITBOX_ROLE_COUNT = 3;

constexpr size_t roleIndex(HitboxRole role) noexcept {
    return static_cast<size_t>(role);
}

constexpr const char* roleToString(HitboxRole role) noexcept {
    switch (role) {
        case HitboxRole::Locator: return "Locator";
        case HitboxRole::Overlap: return "Overlap";
        case HitboxRole::Solid:   return "Solid";
        default:                  return "Unknown";
    }
}

struct ChunkCoord {
    int x{0};
    int y{0};

    bool operator==(const ChunkCoord&) const = default;
};

struct ChunkCoordHash {
    size_t operator()(const ChunkCoord& c) const noexcept {
        return (static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32) ^
               static_cast<uint32_t>(c.y);
    }
};

/**
 * @brief Inclusive rectangle of chunk coordinates
 */
struct ChunkRange {
    int x1{0};
    int y1{0};
    int x2{0};
    int y2{0};

    bool contains(const ChunkCoord& c) const {
        return c.x >= x1 && c.x <= x2 && c.y >= y1 && c.y <= y2;
    }

    size_t chunkCount() const {
        return static_cast<size_t>(x2 - x1 + 1) * static_cast<size_t>(y2 - y1 + 1);
    }

    bool operator==(const ChunkRange&) const = default;
};

/**
 * @brief A shape as seen by the ChunkIndex
 *
 * The registration fields (roles, chunkRange, activeRoleCount) belong to the
 * ChunkIndex and are only changed through it. chunkRange is set exactly when
 * activeRoleCount > 0.
 */
struct Hitbox {
    ShapeHandle id{};
    AABB bounds{};
    int drawLayer{0}; // locator bucket

    std::array<bool, HITBOX_ROLE_COUNT> roles{};
    std::optional<ChunkRange> chunkRange{};
    int activeRoleCount{0};

    bool hasRole(HitboxRole role) const { return roles[roleIndex(role)]; }
};

} // namespace LatticeEngine

#endif // HITBOX_HPP
