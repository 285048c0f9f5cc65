/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/ChunkIndex.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <map>
#include <stdexcept>

namespace LatticeEngine {

ChunkIndex::ChunkIndex(float chunkWidth, float chunkHeight)
    : m_chunkWidth(chunkWidth), m_chunkHeight(chunkHeight) {
    validateDimensions(chunkWidth, chunkHeight);
}

void ChunkIndex::validateDimensions(float chunkWidth, float chunkHeight) {
    if (!(chunkWidth > 0.0f) || !(chunkHeight > 0.0f)) {
        CHUNK_ERROR(std::format("Invalid chunk dimensions {}x{}", chunkWidth, chunkHeight));
        throw std::invalid_argument(std::format(
            "Lattice Engine - Chunk dimensions must be positive, got {}x{}",
            chunkWidth, chunkHeight));
    }
}

void ChunkIndex::setChunkDimensions(float chunkWidth, float chunkHeight) {
    validateDimensions(chunkWidth, chunkHeight);
    if (chunkWidth == m_chunkWidth && chunkHeight == m_chunkHeight) {
        return;
    }

    m_chunkWidth = chunkWidth;
    m_chunkHeight = chunkHeight;
    m_chunks.clear();

    for (Hitbox* hitbox : m_registered) {
        hitbox->chunkRange = getChunkRange(hitbox->bounds);
        for (size_t r = 0; r < HITBOX_ROLE_COUNT; ++r) {
            if (hitbox->roles[r]) {
                addToRange(*hitbox->chunkRange, *hitbox, static_cast<HitboxRole>(r));
            }
        }
    }

    CHUNK_INFO(std::format("Chunk size set to {}x{}, re-indexed {} hitboxes",
                           chunkWidth, chunkHeight, m_registered.size()));
}

ChunkRange ChunkIndex::getChunkRange(const AABB& bounds) const {
    return ChunkRange{
        static_cast<int>(std::ceil(bounds.x1 / m_chunkWidth)) - 1,
        static_cast<int>(std::ceil(bounds.y1 / m_chunkHeight)) - 1,
        static_cast<int>(std::floor(bounds.x2 / m_chunkWidth)),
        static_cast<int>(std::floor(bounds.y2 / m_chunkHeight))};
}

ChunkIndex::Chunk& ChunkIndex::chunkAt(const ChunkCoord& coord) {
    return m_chunks[coord];
}

const ChunkIndex::Chunk* ChunkIndex::findChunk(const ChunkCoord& coord) const {
    auto it = m_chunks.find(coord);
    return it != m_chunks.end() ? &it->second : nullptr;
}

void ChunkIndex::insertInto(Chunk& chunk, const Hitbox& hitbox, HitboxRole role) {
    bool inserted = false;
    switch (role) {
        case HitboxRole::Locator:
            inserted = chunk.locators[hitbox.drawLayer].insert(&hitbox).second;
            break;
        case HitboxRole::Overlap:
            inserted = chunk.overlaps.insert(&hitbox).second;
            break;
        case HitboxRole::Solid:
            inserted = chunk.solids.insert(&hitbox).second;
            break;
    }
    if (inserted) {
        ++m_mutations;
    }
}

void ChunkIndex::eraseFrom(Chunk& chunk, const Hitbox& hitbox, HitboxRole role) {
    size_t erased = 0;
    switch (role) {
        case HitboxRole::Locator: {
            auto layer = chunk.locators.find(hitbox.drawLayer);
            if (layer != chunk.locators.end()) {
                erased = layer->second.erase(&hitbox);
                if (layer->second.empty()) {
                    chunk.locators.erase(layer);
                }
            }
            break;
        }
        case HitboxRole::Overlap:
            erased = chunk.overlaps.erase(&hitbox);
            break;
        case HitboxRole::Solid:
            erased = chunk.solids.erase(&hitbox);
            break;
    }
    m_mutations += erased;
}

void ChunkIndex::addToRange(const ChunkRange& range, const Hitbox& hitbox,
                            HitboxRole role) {
    for (int y = range.y1; y <= range.y2; ++y) {
        for (int x = range.x1; x <= range.x2; ++x) {
            insertInto(chunkAt(ChunkCoord{x, y}), hitbox, role);
        }
    }
}

void ChunkIndex::removeFromRange(const ChunkRange& range, const Hitbox& hitbox,
                                 HitboxRole role) {
    for (int y = range.y1; y <= range.y2; ++y) {
        for (int x = range.x1; x <= range.x2; ++x) {
            auto it = m_chunks.find(ChunkCoord{x, y});
            if (it != m_chunks.end()) {
                eraseFrom(it->second, hitbox, role);
            }
        }
    }
}

bool ChunkIndex::addRole(Hitbox& hitbox, HitboxRole role) {
    if (hitbox.hasRole(role)) {
        return false;
    }

    if (hitbox.activeRoleCount == 0) {
        hitbox.chunkRange = getChunkRange(hitbox.bounds);
        m_registered.insert(&hitbox);
    }
    hitbox.roles[roleIndex(role)] = true;
    ++hitbox.activeRoleCount;
    addToRange(*hitbox.chunkRange, hitbox, role);
    return true;
}

bool ChunkIndex::removeRole(Hitbox& hitbox, HitboxRole role) {
    if (!hitbox.hasRole(role)) {
        return false;
    }

    removeFromRange(*hitbox.chunkRange, hitbox, role);
    hitbox.roles[roleIndex(role)] = false;
    if (--hitbox.activeRoleCount == 0) {
        hitbox.chunkRange.reset();
        m_registered.erase(&hitbox);
    }
    return true;
}

void ChunkIndex::removeAllRoles(Hitbox& hitbox) {
    for (size_t r = 0; r < HITBOX_ROLE_COUNT; ++r) {
        removeRole(hitbox, static_cast<HitboxRole>(r));
    }
}

void ChunkIndex::updateChunks(Hitbox& hitbox) {
    if (!hitbox.chunkRange) {
        return;
    }

    const ChunkRange oldRange = *hitbox.chunkRange;
    const ChunkRange newRange = getChunkRange(hitbox.bounds);
    if (oldRange == newRange) {
        return;
    }

    // Leave chunks only in the old range
    for (int y = oldRange.y1; y <= oldRange.y2; ++y) {
        for (int x = oldRange.x1; x <= oldRange.x2; ++x) {
            ChunkCoord c{x, y};
            if (newRange.contains(c)) {
                continue;
            }
            auto it = m_chunks.find(c);
            if (it == m_chunks.end()) {
                continue;
            }
            for (size_t r = 0; r < HITBOX_ROLE_COUNT; ++r) {
                if (hitbox.roles[r]) {
                    eraseFrom(it->second, hitbox, static_cast<HitboxRole>(r));
                }
            }
        }
    }

    // Enter chunks only in the new range
    for (int y = newRange.y1; y <= newRange.y2; ++y) {
        for (int x = newRange.x1; x <= newRange.x2; ++x) {
            ChunkCoord c{x, y};
            if (oldRange.contains(c)) {
                continue;
            }
            Chunk& chunk = chunkAt(c);
            for (size_t r = 0; r < HITBOX_ROLE_COUNT; ++r) {
                if (hitbox.roles[r]) {
                    insertInto(chunk, hitbox, static_cast<HitboxRole>(r));
                }
            }
        }
    }

    hitbox.chunkRange = newRange;
}

void ChunkIndex::changeDrawLayer(Hitbox& hitbox, int drawLayer) {
    if (hitbox.drawLayer == drawLayer) {
        return;
    }

    if (hitbox.hasRole(HitboxRole::Locator)) {
        removeFromRange(*hitbox.chunkRange, hitbox, HitboxRole::Locator);
        hitbox.drawLayer = drawLayer;
        addToRange(*hitbox.chunkRange, hitbox, HitboxRole::Locator);
    } else {
        hitbox.drawLayer = drawLayer;
    }
}

void ChunkIndex::query(HitboxRole role, const AABB& region,
                       std::vector<const Hitbox*>& out) const {
    const ChunkRange range = getChunkRange(region);
    const size_t firstResult = out.size();

    for (int y = range.y1; y <= range.y2; ++y) {
        for (int x = range.x1; x <= range.x2; ++x) {
            const Chunk* chunk = findChunk(ChunkCoord{x, y});
            if (!chunk) {
                continue;
            }
            auto collect = [&](const HitboxSet& set) {
                for (const Hitbox* hitbox : set) {
                    if (hitbox->bounds.overlaps(region)) {
                        out.push_back(hitbox);
                    }
                }
            };
            switch (role) {
                case HitboxRole::Locator:
                    for (const auto& [layer, set] : chunk->locators) {
                        collect(set);
                    }
                    break;
                case HitboxRole::Overlap:
                    collect(chunk->overlaps);
                    break;
                case HitboxRole::Solid:
                    collect(chunk->solids);
                    break;
            }
        }
    }

    auto byHandle = [](const Hitbox* a, const Hitbox* b) { return a->id < b->id; };
    std::sort(out.begin() + firstResult, out.end(), byHandle);
    out.erase(std::unique(out.begin() + firstResult, out.end()), out.end());
}

void ChunkIndex::forEachVisible(int minLayer, int maxLayer, const AABB& region,
                                const std::function<void(const Hitbox&)>& fn) const {
    if (minLayer > maxLayer) {
        return;
    }

    const ChunkRange range = getChunkRange(region);
    std::map<int, std::vector<const Hitbox*>> layers;

    for (int y = range.y1; y <= range.y2; ++y) {
        for (int x = range.x1; x <= range.x2; ++x) {
            const Chunk* chunk = findChunk(ChunkCoord{x, y});
            if (!chunk) {
                continue;
            }
            auto it = chunk->locators.lower_bound(minLayer);
            auto end = chunk->locators.upper_bound(maxLayer);
            for (; it != end; ++it) {
                for (const Hitbox* hitbox : it->second) {
                    if (hitbox->bounds.overlaps(region)) {
                        layers[it->first].push_back(hitbox);
                    }
                }
            }
        }
    }

    auto byHandle = [](const Hitbox* a, const Hitbox* b) { return a->id < b->id; };
    for (auto& [layer, hitboxes] : layers) {
        std::sort(hitboxes.begin(), hitboxes.end(), byHandle);
        hitboxes.erase(std::unique(hitboxes.begin(), hitboxes.end()), hitboxes.end());
        for (const Hitbox* hitbox : hitboxes) {
            fn(*hitbox);
        }
    }
}

bool ChunkIndex::chunkContains(const ChunkCoord& coord, HitboxRole role,
                               const Hitbox& hitbox) const {
    const Chunk* chunk = findChunk(coord);
    if (!chunk) {
        return false;
    }
    switch (role) {
        case HitboxRole::Locator:
            for (const auto& [layer, set] : chunk->locators) {
                if (set.count(&hitbox) != 0) {
                    return true;
                }
            }
            return false;
        case HitboxRole::Overlap:
            return chunk->overlaps.count(&hitbox) != 0;
        case HitboxRole::Solid:
            return chunk->solids.count(&hitbox) != 0;
    }
    return false;
}

size_t ChunkIndex::chunkSize(const ChunkCoord& coord, HitboxRole role) const {
    const Chunk* chunk = findChunk(coord);
    if (!chunk) {
        return 0;
    }
    switch (role) {
        case HitboxRole::Locator: {
            size_t total = 0;
            for (const auto& [layer, set] : chunk->locators) {
                total += set.size();
            }
            return total;
        }
        case HitboxRole::Overlap:
            return chunk->overlaps.size();
        case HitboxRole::Solid:
            return chunk->solids.size();
    }
    return 0;
}

void ChunkIndex::clear() {
    for (Hitbox* hitbox : m_registered) {
        hitbox->roles = {};
        hitbox->activeRoleCount = 0;
        hitbox->chunkRange.reset();
    }
    m_registered.clear();
    m_chunks.clear();
}

} // namespace LatticeEngine
