/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "sim/NodeScheduler.hpp"
#include "core/Logger.hpp"
#include "gameStates/SimulationState.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>
#include <unordered_set>

namespace LatticeEngine {

NodeScheduler::NodeScheduler(SimulationState& owner, PendingChanges& changes)
    : m_owner(owner), m_changes(changes) {}

NodeScheduler::~NodeScheduler() = default;

// ---------------------------------------------------------------------------
// Arena
// ---------------------------------------------------------------------------

NodeHandle NodeScheduler::createNode(std::unique_ptr<NodeBehavior> behavior) {
    uint32_t index;
    if (!m_freeSlots.empty()) {
        index = m_freeSlots.back();
        m_freeSlots.pop_back();
    } else {
        index = static_cast<uint32_t>(m_slots.size());
        m_slots.emplace_back();
    }

    NodeSlot& slot = m_slots[index];
    slot.record = NodeRecord{};
    slot.record.behavior = std::move(behavior);
    slot.alive = true;
    ++m_liveNodes;

    return NodeHandle{index, slot.generation};
}

bool NodeScheduler::isAlive(NodeHandle node) const {
    if (!node.isValid() || node.index >= m_slots.size()) {
        return false;
    }
    const NodeSlot& slot = m_slots[node.index];
    return slot.alive && slot.generation == node.generation;
}

NodeScheduler::NodeRecord& NodeScheduler::record(NodeHandle node) {
    return m_slots[node.index].record;
}

const NodeScheduler::NodeRecord& NodeScheduler::record(NodeHandle node) const {
    return m_slots[node.index].record;
}

NodeScheduler::NodeRecord& NodeScheduler::checkedRecord(NodeHandle node,
                                                        const char* operation) {
    if (!isAlive(node)) {
        SCHEDULER_ERROR(std::format("{}: stale or invalid node {}", operation,
                                    node.toString()));
        throw std::out_of_range(std::format(
            "Lattice Engine - {}: stale or invalid node {}", operation,
            node.toString()));
    }
    return record(node);
}

const NodeScheduler::NodeRecord&
NodeScheduler::checkedRecord(NodeHandle node, const char* operation) const {
    if (!isAlive(node)) {
        SCHEDULER_ERROR(std::format("{}: stale or invalid node {}", operation,
                                    node.toString()));
        throw std::out_of_range(std::format(
            "Lattice Engine - {}: stale or invalid node {}", operation,
            node.toString()));
    }
    return record(node);
}

bool NodeScheduler::destroyNode(NodeHandle node) {
    if (!isAlive(node)) {
        return false;
    }
    NodeRecord& rec = record(node);
    if (rec.destroyPending) {
        return false;
    }

    if (m_changes.isDeferring()) {
        rec.destroyPending = true;
        if (!rec.pendingGroup.isNone()) {
            rec.pendingGroup = GroupRef{};
            m_changes.push(StructuralChange{StructuralChange::Type::DetachNode,
                                            node, GroupRef{}, ShapeHandle{}});
        }
        m_changes.push(StructuralChange{StructuralChange::Type::DestroyNode,
                                        node, GroupRef{}, ShapeHandle{}});
        return true;
    }

    applyDestroy(node);
    return true;
}

void NodeScheduler::freeSubtree(NodeHandle node) {
    // Children go down with the parent without their removal hooks
    std::vector<NodeHandle> children;
    children.swap(record(node).children);
    for (NodeHandle child : children) {
        record(child).group = GroupRef{};
        record(child).pendingGroup = GroupRef{};
        freeSubtree(child);
    }

    NodeSlot& slot = m_slots[node.index];
    slot.record = NodeRecord{};
    slot.alive = false;
    if (++slot.generation == NodeHandle::INVALID_GENERATION) {
        slot.generation = 1;
    }
    m_freeSlots.push_back(node.index);
    --m_liveNodes;
}

// ---------------------------------------------------------------------------
// Membership
// ---------------------------------------------------------------------------

void NodeScheduler::attach(NodeHandle node, NodeHandle parent) {
    NodeRecord& rec = checkedRecord(node, "attach");
    if (rec.destroyPending) {
        SCHEDULER_ERROR(std::format("attach: node {} is being destroyed", node.toString()));
        throw std::logic_error("Lattice Engine - Cannot attach a node that is being destroyed");
    }
    if (!rec.pendingGroup.isNone()) {
        SCHEDULER_ERROR(std::format("attach: node {} is already in a group", node.toString()));
        throw std::logic_error(
            "Lattice Engine - Node is already attached; detach it first");
    }

    GroupRef target = GroupRef::root();
    if (parent.isValid()) {
        const NodeRecord& parentRec = checkedRecord(parent, "attach");
        if (parentRec.destroyPending) {
            SCHEDULER_ERROR(std::format("attach: parent {} is being destroyed",
                                        parent.toString()));
            throw std::logic_error(
                "Lattice Engine - Cannot attach to a node that is being destroyed");
        }
        // Walk the requested ancestry of parent; reaching node means a cycle
        NodeHandle current = parent;
        while (current.isValid()) {
            if (current == node) {
                SCHEDULER_ERROR(std::format("attach: {} under {} would create a cycle",
                                            node.toString(), parent.toString()));
                throw std::logic_error(
                    "Lattice Engine - A node cannot be attached under itself or its descendants");
            }
            const GroupRef& up = record(current).pendingGroup;
            current = up.kind == GroupRef::Kind::Node ? up.node : NodeHandle{};
        }
        target = GroupRef::of(parent);
    }

    rec.pendingGroup = target;
    if (m_changes.isDeferring()) {
        m_changes.push(StructuralChange{StructuralChange::Type::AttachNode,
                                        node, target, ShapeHandle{}});
    } else {
        applyAttach(node, target);
    }
}

bool NodeScheduler::detach(NodeHandle node) {
    NodeRecord& rec = checkedRecord(node, "detach");
    if (rec.pendingGroup.isNone()) {
        return false;
    }

    rec.pendingGroup = GroupRef{};
    if (m_changes.isDeferring()) {
        m_changes.push(StructuralChange{StructuralChange::Type::DetachNode,
                                        node, GroupRef{}, ShapeHandle{}});
    } else {
        applyDetach(node);
    }
    return true;
}

NodeMembership NodeScheduler::getMembership(NodeHandle node) const {
    const NodeRecord& rec = checkedRecord(node, "getMembership");
    if (rec.group.isNone()) {
        return rec.pendingGroup.isNone() ? NodeMembership::Detached
                                         : NodeMembership::PendingAttach;
    }
    if (rec.pendingGroup.isNone()) {
        return NodeMembership::PendingDetach;
    }
    return rec.pendingGroup == rec.group ? NodeMembership::Attached
                                         : NodeMembership::PendingMove;
}

bool NodeScheduler::isAttached(NodeHandle node) const {
    return !checkedRecord(node, "isAttached").group.isNone();
}

bool NodeScheduler::isInState(NodeHandle node) const {
    return checkedRecord(node, "isInState").inState;
}

NodeHandle NodeScheduler::getParent(NodeHandle node) const {
    const GroupRef& group = checkedRecord(node, "getParent").group;
    return group.kind == GroupRef::Kind::Node ? group.node : NodeHandle{};
}

const std::vector<NodeHandle>& NodeScheduler::getChildren(NodeHandle parent) const {
    if (!parent.isValid()) {
        return m_rootMembers;
    }
    return checkedRecord(parent, "getChildren").children;
}

std::vector<NodeHandle>& NodeScheduler::membersOf(const GroupRef& group) {
    return group.isRoot() ? m_rootMembers : record(group.node).children;
}

bool NodeScheduler::groupInState(const GroupRef& group) const {
    if (group.isRoot()) {
        return true;
    }
    return group.kind == GroupRef::Kind::Node && record(group.node).inState;
}

bool NodeScheduler::isAncestorOrSelf(NodeHandle ancestor, NodeHandle node) const {
    NodeHandle current = node;
    while (current.isValid()) {
        if (current == ancestor) {
            return true;
        }
        const GroupRef& up = record(current).group;
        current = up.kind == GroupRef::Kind::Node ? up.node : NodeHandle{};
    }
    return false;
}

void NodeScheduler::insertSorted(std::vector<NodeHandle>& members, NodeHandle node) {
    const NodeRecord& rec = record(node);
    auto pos = std::find_if(members.begin(), members.end(), [&](NodeHandle other) {
        const NodeRecord& o = record(other);
        return o.priority < rec.priority ||
               (o.priority == rec.priority && o.sequence > rec.sequence);
    });
    members.insert(pos, node);
}

void NodeScheduler::link(NodeHandle node, const GroupRef& target) {
    NodeRecord& rec = record(node);
    rec.group = target;
    rec.priority = rec.pendingPriority;
    rec.sequence = m_nextSequence++;
    rec.ticksThisFrame = 0;
    insertSorted(membersOf(target), node);
    setContext(node, groupInState(target));

    if (m_frameHooksRan) {
        m_newNodes.push_back(node);
    }
}

void NodeScheduler::unlink(NodeHandle node) {
    NodeRecord& rec = record(node);
    std::vector<NodeHandle>& members = membersOf(rec.group);
    members.erase(std::remove(members.begin(), members.end(), node), members.end());
    rec.group = GroupRef{};
    rec.ticksThisFrame = 0;
    setContext(node, false);
}

void NodeScheduler::setContext(NodeHandle node, bool inState) {
    NodeRecord& rec = record(node);
    rec.inState = inState;
    for (NodeHandle child : rec.children) {
        setContext(child, inState);
    }
}

// ---------------------------------------------------------------------------
// Buffered change application
// ---------------------------------------------------------------------------

bool NodeScheduler::applyChange(const StructuralChange& change) {
    switch (change.type) {
        case StructuralChange::Type::AttachNode:
            applyAttach(change.node, change.group);
            return true;
        case StructuralChange::Type::DetachNode:
            applyDetach(change.node);
            return true;
        case StructuralChange::Type::RepositionNode:
            applyReposition(change.node);
            return true;
        case StructuralChange::Type::DestroyNode:
            applyDestroy(change.node);
            return true;
        default:
            return false;
    }
}

void NodeScheduler::applyAttach(NodeHandle node, const GroupRef& target) {
    if (!isAlive(node)) {
        return;
    }
    NodeRecord& rec = record(node);
    // A later detach, re-attach or destroy in the same pass supersedes this
    if (rec.destroyPending || !(rec.pendingGroup == target) || rec.group == target) {
        return;
    }

    if (target.kind == GroupRef::Kind::Node) {
        if (!isAlive(target.node) || record(target.node).destroyPending ||
            isAncestorOrSelf(node, target.node)) {
            SCHEDULER_WARN(std::format("Dropping attach of {} to unavailable parent {}",
                                       node.toString(), target.node.toString()));
            rec.pendingGroup = GroupRef{};
            return;
        }
    }

    if (!rec.group.isNone()) {
        // Re-attached from inside its own removal hook
        unlink(node);
    }

    link(node, target);
    if (NodeBehavior* behavior = record(node).behavior.get()) {
        behavior->onAdded(m_owner, node);
    }
}

void NodeScheduler::applyDetach(NodeHandle node) {
    if (!isAlive(node)) {
        return;
    }
    const NodeRecord& rec = record(node);
    if (rec.group.isNone() || rec.pendingGroup == rec.group) {
        // Not linked, or re-attached to the same group later in the pass
        return;
    }

    if (NodeBehavior* behavior = record(node).behavior.get()) {
        behavior->onRemoved(m_owner, node);
    }
    if (isAlive(node) && !record(node).group.isNone() &&
        !(record(node).pendingGroup == record(node).group)) {
        unlink(node);
    }
}

void NodeScheduler::applyReposition(NodeHandle node) {
    if (!isAlive(node)) {
        return;
    }
    NodeRecord& rec = record(node);
    if (rec.group.isNone() || rec.priority == rec.pendingPriority) {
        return;
    }

    std::vector<NodeHandle>& members = membersOf(rec.group);
    members.erase(std::remove(members.begin(), members.end(), node), members.end());
    rec.priority = rec.pendingPriority;
    insertSorted(members, node);
}

void NodeScheduler::applyDestroy(NodeHandle node) {
    if (!isAlive(node)) {
        return;
    }
    NodeRecord& rec = record(node);
    rec.destroyPending = true;
    rec.pendingGroup = GroupRef{};
    applyDetach(node);
    if (isAlive(node)) {
        freeSubtree(node);
    }
}

// ---------------------------------------------------------------------------
// Per-node attributes
// ---------------------------------------------------------------------------

void NodeScheduler::setPriority(NodeHandle node, int priority) {
    NodeRecord& rec = checkedRecord(node, "setPriority");
    rec.pendingPriority = priority;

    if (rec.group.isNone()) {
        rec.priority = priority;
        return;
    }
    if (m_changes.isDeferring()) {
        m_changes.push(StructuralChange{StructuralChange::Type::RepositionNode,
                                        node, GroupRef{}, ShapeHandle{}});
    } else {
        applyReposition(node);
    }
}

int NodeScheduler::getPriority(NodeHandle node) const {
    return checkedRecord(node, "getPriority").priority;
}

int NodeScheduler::getPendingPriority(NodeHandle node) const {
    return checkedRecord(node, "getPendingPriority").pendingPriority;
}

void NodeScheduler::setTimeFactor(NodeHandle node, Frac::Value timeFactor) {
    checkedRecord(node, "setTimeFactor").timeFactor = timeFactor;
}

Frac::Value NodeScheduler::getTimeFactor(NodeHandle node) const {
    return checkedRecord(node, "getTimeFactor").timeFactor;
}

Frac::Value NodeScheduler::getEffectiveTimeFactor(NodeHandle node) const {
    const NodeRecord* rec = &checkedRecord(node, "getEffectiveTimeFactor");
    if (!rec->inState || !m_owner.isActive()) {
        return 0;
    }
    while (rec->group.kind == GroupRef::Kind::Node) {
        rec = &record(rec->group.node);
    }
    return rec->timeFactor < 0 ? m_owner.getTimeFactor() : rec->timeFactor;
}

Frac::Value NodeScheduler::getLeftoverTime(NodeHandle node) const {
    return checkedRecord(node, "getLeftoverTime").leftover;
}

void NodeScheduler::setTimer(NodeHandle node, const TimedEventPtr& event, int ticks) {
    checkedRecord(node, "setTimer").timers.set(event, ticks);
}

int NodeScheduler::getTimer(NodeHandle node, const TimedEventPtr& event) const {
    return checkedRecord(node, "getTimer").timers.get(event);
}

NodeBehavior* NodeScheduler::getBehavior(NodeHandle node) const {
    return checkedRecord(node, "getBehavior").behavior.get();
}

// ---------------------------------------------------------------------------
// Frame driver
// ---------------------------------------------------------------------------

int NodeScheduler::advanceClocks(Frac::Value frameScale) {
    int maxTicks = 0;
    for (NodeHandle node : m_rootMembers) {
        NodeRecord& rec = record(node);
        Frac::Value factor =
            rec.timeFactor < 0 ? m_owner.getTimeFactor() : rec.timeFactor;
        rec.leftover += Frac::mulCarry(factor, frameScale, rec.scaleRemainder);

        int64_t ticks = Frac::wholeUnits(rec.leftover);
        rec.leftover -= ticks * Frac::UNIT;
        rec.ticksThisFrame = static_cast<int>(ticks);
        maxTicks = std::max(maxTicks, rec.ticksThisFrame);
    }
    return maxTicks;
}

void NodeScheduler::fireTimers(std::vector<TimedEventPtr>& due) {
    for (const TimedEventPtr& event : due) {
        event->fire();
    }
    due.clear();
}

void NodeScheduler::tickNode(NodeHandle node) {
    NodeRecord& rec = record(node);
    std::vector<TimedEventPtr> due;

    if (!rec.timers.empty()) {
        rec.timers.advance(due);
        fireTimers(due);
    }

    if (rec.behavior) {
        rec.behavior->onTick(m_owner, node);
    }

    if (!rec.timers.empty()) {
        rec.timers.collectExpired(due);
        fireTimers(due);
    }

    // Membership changes are deferred, so the child list is stable here
    for (size_t i = 0; i < rec.children.size(); ++i) {
        tickNode(rec.children[i]);
    }
}

void NodeScheduler::runTickPass(int pass) {
    for (size_t i = 0; i < m_rootMembers.size(); ++i) {
        NodeHandle node = m_rootMembers[i];
        if (record(node).ticksThisFrame > pass) {
            tickNode(node);
        }
    }
}

void NodeScheduler::refundTicks(int passesRun) {
    for (NodeHandle node : m_rootMembers) {
        NodeRecord& rec = record(node);
        if (rec.ticksThisFrame > passesRun) {
            rec.leftover += (rec.ticksThisFrame - passesRun) * Frac::UNIT;
            rec.ticksThisFrame = passesRun;
        }
    }
}

void NodeScheduler::frameNode(NodeHandle node) {
    NodeRecord& rec = record(node);
    if (rec.behavior) {
        rec.behavior->onFrame(m_owner, node);
    }
    for (size_t i = 0; i < rec.children.size(); ++i) {
        frameNode(rec.children[i]);
    }
}

void NodeScheduler::runFramePass() {
    for (size_t i = 0; i < m_rootMembers.size(); ++i) {
        frameNode(m_rootMembers[i]);
    }
    m_frameHooksRan = true;
}

void NodeScheduler::catchUpNewNodes() {
    if (m_newNodes.empty()) {
        return;
    }

    std::vector<NodeHandle> batch;
    batch.swap(m_newNodes);

    // A subtree's frame pass covers its descendants, so only run the
    // outermost newly attached nodes that are still in the state
    std::unordered_set<NodeHandle> newSet(batch.begin(), batch.end());
    std::unordered_set<NodeHandle> ran;
    for (NodeHandle node : batch) {
        if (!isAlive(node) || !record(node).inState || !ran.insert(node).second) {
            continue;
        }
        bool coveredByAncestor = false;
        for (GroupRef up = record(node).group; up.kind == GroupRef::Kind::Node;
             up = record(up.node).group) {
            if (newSet.count(up.node) != 0) {
                coveredByAncestor = true;
                break;
            }
        }
        if (!coveredByAncestor) {
            frameNode(node);
        }
    }
}

void NodeScheduler::endFrame() {
    m_frameHooksRan = false;
    m_newNodes.clear();
}

} // namespace LatticeEngine
