/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NODE_BEHAVIOR_HPP
#define NODE_BEHAVIOR_HPP

#include "sim/SimHandles.hpp"
#include <functional>
#include <string>

class SimulationState;

namespace LatticeEngine {

/**
 * @brief Hooks a simulation node runs while it is part of a state
 *
 * One behavior object is owned by each node that has one. All hooks run on
 * the thread driving the frame loop. Structural changes requested from inside
 * a hook (attach, detach, priority, add/remove shape) are buffered and take
 * effect at the next flush.
 */
class NodeBehavior {
public:
    virtual ~NodeBehavior() = default;

    // Immediately after the node is linked into a group
    virtual void onAdded(SimulationState& /*state*/, NodeHandle /*self*/) {}

    // Immediately before the node is unlinked from its group
    virtual void onRemoved(SimulationState& /*state*/, NodeHandle /*self*/) {}

    // Once per tick, after the node's timers fired
    virtual void onTick(SimulationState& /*state*/, NodeHandle /*self*/) {}

    // Once per frame, after every tick of the frame
    virtual void onFrame(SimulationState& /*state*/, NodeHandle /*self*/) {}

    virtual std::string getName() const { return "NodeBehavior"; }
};

/**
 * @brief NodeBehavior assembled from callables, handy for small nodes
 *
 * Usage:
 *   auto behavior = std::make_unique<CallbackBehavior>("Spinner");
 *   behavior->tick = [](SimulationState& s, NodeHandle self) { ... };
 */
class CallbackBehavior : public NodeBehavior {
public:
    using Hook = std::function<void(SimulationState&, NodeHandle)>;

    explicit CallbackBehavior(std::string name = "CallbackBehavior")
        : m_name(std::move(name)) {}

    Hook added;
    Hook removed;
    Hook tick;
    Hook frame;

    void onAdded(SimulationState& state, NodeHandle self) override {
        if (added) added(state, self);
    }
    void onRemoved(SimulationState& state, NodeHandle self) override {
        if (removed) removed(state, self);
    }
    void onTick(SimulationState& state, NodeHandle self) override {
        if (tick) tick(state, self);
    }
    void onFrame(SimulationState& state, NodeHandle self) override {
        if (frame) frame(state, self);
    }

    std::string getName() const override { return m_name; }

private:
    std::string m_name;
};

} // namespace LatticeEngine

#endif // NODE_BEHAVIOR_HPP
