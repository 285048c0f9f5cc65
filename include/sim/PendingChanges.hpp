/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PENDING_CHANGES_HPP
#define PENDING_CHANGES_HPP

#include "sim/SimHandles.hpp"
#include <cstdint>
#include <vector>

namespace LatticeEngine {

/**
 * @brief Node group reference: the state's root group or a parent node
 */
struct GroupRef {
    enum class Kind : uint8_t { None, Root, Node };

    Kind kind{Kind::None};
    NodeHandle node{};

    static constexpr GroupRef root() noexcept { return GroupRef{Kind::Root, NodeHandle{}}; }
    static constexpr GroupRef of(NodeHandle parent) noexcept { return GroupRef{Kind::Node, parent}; }

    [[nodiscard]] constexpr bool isNone() const noexcept { return kind == Kind::None; }
    [[nodiscard]] constexpr bool isRoot() const noexcept { return kind == Kind::Root; }

    constexpr bool operator==(const GroupRef&) const = default;
};

/**
 * @brief One buffered structural change
 */
struct StructuralChange {
    enum class Type : uint8_t {
        AttachNode,
        DetachNode,
        RepositionNode, // apply the node's pending priority
        DestroyNode,
        AddShape,
        RemoveShape,
        DestroyShape
    };

    Type type;
    NodeHandle node{};
    GroupRef group{};   // AttachNode target
    ShapeHandle shape{};
};

/**
 * @brief Structural change queue owned by one SimulationState
 *
 * While a pass is in progress the queue is deferring: every structural
 * request is recorded instead of applied. The owning state drains it at the
 * flush points between passes.
 */
class PendingChanges {
public:
    /**
     * @brief RAII guard marking a pass (or flush) in progress
     *
     * Scopes nest; changes stay deferred until the outermost scope ends.
     */
    class Scope {
    public:
        explicit Scope(PendingChanges& changes) : m_changes(changes) {
            ++m_changes.m_depth;
        }
        ~Scope() { --m_changes.m_depth; }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        PendingChanges& m_changes;
    };

    bool isDeferring() const { return m_depth > 0; }

    void push(const StructuralChange& change) { m_queue.push_back(change); }

    bool empty() const { return m_queue.empty(); }
    size_t size() const { return m_queue.size(); }

    /**
     * @brief Moves the current batch out, leaving the queue empty
     *
     * Changes pushed while the batch is being applied form the next batch.
     */
    std::vector<StructuralChange> drain() {
        std::vector<StructuralChange> batch;
        batch.swap(m_queue);
        return batch;
    }

private:
    std::vector<StructuralChange> m_queue{};
    int m_depth{0};
};

} // namespace LatticeEngine

#endif // PENDING_CHANGES_HPP
