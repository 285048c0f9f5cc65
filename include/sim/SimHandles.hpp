/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIM_HANDLES_HPP
#define SIM_HANDLES_HPP

#include <compare>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <string>

namespace LatticeEngine {

/**
 * @brief Generation-checked reference into one of SimulationState's arenas
 *
 * A handle is an arena slot index plus the generation the slot had when the
 * object was created. Freeing a slot bumps its generation, so handles to a
 * destroyed object are detected as stale instead of aliasing whatever reuses
 * the slot. Handles are cheap to copy and compare and never own anything.
 *
 * The Tag parameter keeps node and shape handles from being mixed up.
 */
template <typename Tag>
struct SlotHandle {
    using IndexType = uint32_t;
    using Generation = uint32_t;

    static constexpr IndexType INVALID_INDEX = 0xFFFFFFFFu;
    static constexpr Generation INVALID_GENERATION = 0;

    IndexType index{INVALID_INDEX};
    Generation generation{INVALID_GENERATION};

    constexpr SlotHandle() noexcept = default;
    constexpr SlotHandle(IndexType slotIndex, Generation gen) noexcept
        : index(slotIndex), generation(gen) {}

    [[nodiscard]] constexpr bool isValid() const noexcept {
        return index != INVALID_INDEX && generation != INVALID_GENERATION;
    }

    constexpr auto operator<=>(const SlotHandle&) const = default;

    [[nodiscard]] std::string toString() const {
        if (!isValid()) {
            return "Handle(invalid)";
        }
        return std::format("Handle({}:{})", index, generation);
    }
};

struct NodeTag {};
struct ShapeTag {};

using NodeHandle = SlotHandle<NodeTag>;
using ShapeHandle = SlotHandle<ShapeTag>;

template <typename Tag>
std::ostream& operator<<(std::ostream& os, const SlotHandle<Tag>& handle) {
    return os << handle.toString();
}

} // namespace LatticeEngine

template <typename Tag>
struct std::hash<LatticeEngine::SlotHandle<Tag>> {
    size_t operator()(const LatticeEngine::SlotHandle<Tag>& h) const noexcept {
        return (static_cast<uint64_t>(h.index) << 32) ^ h.generation;
    }
};

#endif // SIM_HANDLES_HPP
