/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NODE_SCHEDULER_HPP
#define NODE_SCHEDULER_HPP

#include "core/FixedPoint.hpp"
#include "sim/NodeBehavior.hpp"
#include "sim/PendingChanges.hpp"
#include "sim/SimHandles.hpp"
#include "sim/TimerRegistry.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <vector>

class SimulationState;

namespace LatticeEngine {

/**
 * @brief Logical vs. active group membership of a node
 */
enum class NodeMembership : uint8_t {
    Detached,      // in no group and none requested
    Attached,      // in the group it should be in
    PendingAttach, // requested into a group, not linked yet
    PendingDetach, // still linked, removal requested
    PendingMove    // still linked, requested into a different group
};

constexpr const char* membershipToString(NodeMembership m) noexcept {
    switch (m) {
        case NodeMembership::Detached:      return "Detached";
        case NodeMembership::Attached:      return "Attached";
        case NodeMembership::PendingAttach: return "PendingAttach";
        case NodeMembership::PendingDetach: return "PendingDetach";
        case NodeMembership::PendingMove:   return "PendingMove";
        default:                            return "Unknown";
    }
}

/**
 * @brief Hierarchical fixed-timestep scheduler for one SimulationState
 *
 * Nodes live in an arena owned by the scheduler and are referenced by
 * NodeHandle. Every node is also a group: its children run after it in
 * priority order (high to low, ties in attach order). Top-level nodes belong
 * to the state's root group.
 *
 * Time only passes for nodes attached, directly or through ancestors, to the
 * root group of an active state. The root ancestor's time factor decides how
 * many ticks the whole subtree gets each frame; a negative factor inherits the
 * state's factor.
 *
 * Structural requests (attach, detach, priority, destroy) made while the
 * state's PendingChanges queue is deferring are buffered there and applied by
 * the state between passes through applyChange(). Outside a pass they apply
 * immediately.
 */
class NodeScheduler {
public:
    NodeScheduler(SimulationState& owner, PendingChanges& changes);
    ~NodeScheduler();

    NodeScheduler(const NodeScheduler&) = delete;
    NodeScheduler& operator=(const NodeScheduler&) = delete;

    /**
     * @brief Creates a detached node
     * @param behavior Hooks for the node, may be null for a pure group node
     */
    NodeHandle createNode(std::unique_ptr<NodeBehavior> behavior = nullptr);

    /**
     * @brief Detaches a node and frees it together with its subtree
     * @return false if the handle is stale or destruction is already pending
     */
    bool destroyNode(NodeHandle node);

    bool isAlive(NodeHandle node) const;
    size_t getNodeCount() const { return m_liveNodes; }

    /**
     * @brief Requests node membership in parent's group (root if invalid)
     * @throws std::logic_error if the node is attached or pending attachment,
     *         or parent is the node itself or one of its descendants
     * @throws std::out_of_range on stale handles
     */
    void attach(NodeHandle node, NodeHandle parent = NodeHandle{});

    /**
     * @brief Requests removal of a node from its group
     * @return false if the node was already detached or pending detach
     */
    bool detach(NodeHandle node);

    NodeMembership getMembership(NodeHandle node) const;
    bool isAttached(NodeHandle node) const;
    bool isInState(NodeHandle node) const;

    // Current parent node; invalid for top-level and detached nodes
    NodeHandle getParent(NodeHandle node) const;

    // Live members of parent's group in iteration order (root if invalid)
    const std::vector<NodeHandle>& getChildren(NodeHandle parent = NodeHandle{}) const;

    /**
     * @brief Sets the action priority
     *
     * Unattached nodes take the new priority at once. Attached nodes keep
     * their current priority until the group repositions them at a safe
     * point, so a running pass keeps the order it started with.
     */
    void setPriority(NodeHandle node, int priority);
    int getPriority(NodeHandle node) const;
    int getPendingPriority(NodeHandle node) const;

    void setTimeFactor(NodeHandle node, Frac::Value timeFactor);
    Frac::Value getTimeFactor(NodeHandle node) const;
    Frac::Value getEffectiveTimeFactor(NodeHandle node) const;
    Frac::Value getLeftoverTime(NodeHandle node) const;

    void setTimer(NodeHandle node, const TimedEventPtr& event, int ticks);
    int getTimer(NodeHandle node, const TimedEventPtr& event) const;

    NodeBehavior* getBehavior(NodeHandle node) const;

    // Frame driver interface, used by SimulationState

    /**
     * @brief Adds this frame's time to every top-level node
     * @param frameScale Fixed-point number of nominal frames elapsed
     * @return Largest number of ticks any top-level node has to run
     */
    int advanceClocks(Frac::Value frameScale);

    /**
     * @brief Runs tick pass number pass (0-based) of the current frame
     *
     * Each top-level node takes part in as many passes as it accumulated.
     */
    void runTickPass(int pass);

    /**
     * @brief Returns the ticks of passes that will not run this frame
     *
     * Called when the state stops mid-frame after passesRun passes. Ticks a
     * top-level node was owed beyond that go back into its leftover time.
     */
    void refundTicks(int passesRun);

    void runFramePass();

    /**
     * @brief Applies one buffered change
     * @return true if the change was a node change
     */
    bool applyChange(const StructuralChange& change);

    /**
     * @brief Runs the frame hooks missed by nodes attached after the frame pass
     */
    void catchUpNewNodes();

    // Marks the frame boundary; nodes attached afterwards need no catch-up
    void endFrame();

private:
    struct NodeRecord {
        std::unique_ptr<NodeBehavior> behavior{};
        TimerRegistry timers{};
        std::vector<NodeHandle> children{}; // live members, iteration order
        GroupRef group{};                   // group the node is linked into
        GroupRef pendingGroup{};            // group the node should be in
        Frac::Value timeFactor{-1};
        Frac::Value leftover{0};
        Frac::Value scaleRemainder{0}; // sub-unit bits of the clock products
        int priority{0};
        int pendingPriority{0};
        uint64_t sequence{0}; // attach order, breaks priority ties
        int ticksThisFrame{0};
        bool inState{false};
        bool destroyPending{false};
    };

    struct NodeSlot {
        NodeRecord record{};
        uint32_t generation{1};
        bool alive{false};
    };

    NodeRecord& record(NodeHandle node);
    const NodeRecord& record(NodeHandle node) const;
    NodeRecord& checkedRecord(NodeHandle node, const char* operation);
    const NodeRecord& checkedRecord(NodeHandle node, const char* operation) const;

    std::vector<NodeHandle>& membersOf(const GroupRef& group);
    bool groupInState(const GroupRef& group) const;
    bool isAncestorOrSelf(NodeHandle ancestor, NodeHandle node) const;

    void insertSorted(std::vector<NodeHandle>& members, NodeHandle node);
    void link(NodeHandle node, const GroupRef& target);
    void unlink(NodeHandle node);
    void setContext(NodeHandle node, bool inState);

    void applyAttach(NodeHandle node, const GroupRef& target);
    void applyDetach(NodeHandle node);
    void applyReposition(NodeHandle node);
    void applyDestroy(NodeHandle node);
    void freeSubtree(NodeHandle node);

    void tickNode(NodeHandle node);
    void frameNode(NodeHandle node);
    void fireTimers(std::vector<TimedEventPtr>& due);

    SimulationState& m_owner;
    PendingChanges& m_changes;

    // deque keeps records at stable addresses while hooks create nodes
    std::deque<NodeSlot> m_slots{};
    std::vector<uint32_t> m_freeSlots{};
    std::vector<NodeHandle> m_rootMembers{};
    std::vector<NodeHandle> m_newNodes{};
    size_t m_liveNodes{0};
    uint64_t m_nextSequence{1};
    bool m_frameHooksRan{false};
};

} // namespace LatticeEngine

#endif // NODE_SCHEDULER_HPP
