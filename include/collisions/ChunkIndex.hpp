/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CHUNK_INDEX_HPP
#define CHUNK_INDEX_HPP

#include "collisions/AABB.hpp"
#include "collisions/Hitbox.hpp"
#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

namespace LatticeEngine {

/**
 * @brief Uniform grid of chunks indexing hitboxes by role
 *
 * Every chunk keeps one locator set per draw layer plus flat overlap and
 * solid sets. A hitbox with at least one active role is present in every
 * chunk of its cached range, once per active role. Moves re-index
 * incrementally: only chunks that enter or leave the range are touched.
 *
 * The index holds non-owning pointers; a Hitbox must stay at a stable address
 * while registered and must drop all roles before it is destroyed.
 */
class ChunkIndex {
public:
    static constexpr float DEFAULT_CHUNK_SIZE = 256.0f;

    /**
     * @throws std::invalid_argument if either dimension is not positive
     */
    explicit ChunkIndex(float chunkWidth = DEFAULT_CHUNK_SIZE,
                        float chunkHeight = DEFAULT_CHUNK_SIZE);

    /**
     * @brief Changes the chunk size and re-indexes every registered hitbox
     * @throws std::invalid_argument if either dimension is not positive
     */
    void setChunkDimensions(float chunkWidth, float chunkHeight);
    float getChunkWidth() const { return m_chunkWidth; }
    float getChunkHeight() const { return m_chunkHeight; }

    /**
     * @brief Chunks a box is indexed in
     *
     * Lower bounds use ceil(edge / size) - 1, so a box starting exactly on a
     * chunk boundary is also listed in the chunk before it.
     */
    ChunkRange getChunkRange(const AABB& bounds) const;

    /**
     * @return false if the role was already active
     */
    bool addRole(Hitbox& hitbox, HitboxRole role);

    /**
     * @return false if the role was not active
     */
    bool removeRole(Hitbox& hitbox, HitboxRole role);

    void removeAllRoles(Hitbox& hitbox);

    /**
     * @brief Re-indexes a hitbox after its bounds changed
     *
     * Chunks present in both the old and the new range are left alone.
     */
    void updateChunks(Hitbox& hitbox);

    // Moves a locator between per-layer buckets in the same chunks
    void changeDrawLayer(Hitbox& hitbox, int drawLayer);

    /**
     * @brief Hitboxes with role whose bounds overlap region
     *
     * Results are deduplicated and sorted by handle.
     */
    void query(HitboxRole role, const AABB& region,
               std::vector<const Hitbox*>& out) const;

    /**
     * @brief Visits locators overlapping region, layer by layer
     *
     * Layers in [minLayer, maxLayer] are visited in ascending order, each
     * hitbox once per call, ordered by handle within a layer. fn must not
     * change the index.
     */
    void forEachVisible(int minLayer, int maxLayer, const AABB& region,
                        const std::function<void(const Hitbox&)>& fn) const;

    bool chunkContains(const ChunkCoord& coord, HitboxRole role,
                       const Hitbox& hitbox) const;
    size_t chunkSize(const ChunkCoord& coord, HitboxRole role) const;

    size_t getChunkCount() const { return m_chunks.size(); }
    size_t getRegisteredCount() const { return m_registered.size(); }

    // Total chunk set insertions and erasures so far
    uint64_t getMutationCount() const { return m_mutations; }

    void clear();

private:
    using HitboxSet = boost::container::flat_set<const Hitbox*>;

    struct Chunk {
        boost::container::flat_map<int, HitboxSet> locators; // by draw layer
        HitboxSet overlaps;
        HitboxSet solids;
    };

    Chunk& chunkAt(const ChunkCoord& coord);
    const Chunk* findChunk(const ChunkCoord& coord) const;

    void insertInto(Chunk& chunk, const Hitbox& hitbox, HitboxRole role);
    void eraseFrom(Chunk& chunk, const Hitbox& hitbox, HitboxRole role);

    void addToRange(const ChunkRange& range, const Hitbox& hitbox, HitboxRole role);
    void removeFromRange(const ChunkRange& range, const Hitbox& hitbox, HitboxRole role);

    static void validateDimensions(float chunkWidth, float chunkHeight);

    float m_chunkWidth;
    float m_chunkHeight;
    std::unordered_map<ChunkCoord, Chunk, ChunkCoordHash> m_chunks{};
    boost::container::flat_set<Hitbox*> m_registered{};
    uint64_t m_mutations{0};
};

} // namespace LatticeEngine

#endif // CHUNK_INDEX_HPP
