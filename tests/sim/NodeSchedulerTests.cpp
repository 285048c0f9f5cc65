/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE NodeSchedulerTests
#include <boost/test/unit_test.hpp>

#include "gameStates/SimulationState.hpp"
#include "sim/NodeBehavior.hpp"
#include "sim/NodeScheduler.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace LatticeEngine;

namespace {

constexpr double FRAME = 1.0 / 60.0;

struct SchedulerFixture {
    SimulationState state{"SchedulerTestState"};
    NodeScheduler& scheduler{state.getScheduler()};
    std::vector<std::string> log;

    SchedulerFixture() { state.enter(); }

    // Node whose tick hook logs its name
    NodeHandle makeNode(const std::string& name, int priority = 0) {
        auto behavior = std::make_unique<CallbackBehavior>(name);
        behavior->tick = [this, name](SimulationState&, NodeHandle) { log.push_back(name); };
        NodeHandle node = scheduler.createNode(std::move(behavior));
        scheduler.setPriority(node, priority);
        return node;
    }

    CallbackBehavior& hooks(NodeHandle node) {
        return static_cast<CallbackBehavior&>(*scheduler.getBehavior(node));
    }

    void frames(int count, double delta = FRAME) {
        for (int i = 0; i < count; ++i) {
            state.advanceFrame(delta);
        }
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(NodeSchedulerTestSuite, SchedulerFixture)

BOOST_AUTO_TEST_CASE(TicksInDescendingPriorityWithStableTies) {
    NodeHandle low = makeNode("low", 1);
    NodeHandle firstHigh = makeNode("firstHigh", 5);
    NodeHandle secondHigh = makeNode("secondHigh", 5);
    NodeHandle negative = makeNode("negative", -2);
    scheduler.attach(low);
    scheduler.attach(firstHigh);
    scheduler.attach(negative);
    scheduler.attach(secondHigh);

    frames(1);

    const std::vector<std::string> expected{"firstHigh", "secondHigh", "low", "negative"};
    BOOST_CHECK_EQUAL_COLLECTIONS(log.begin(), log.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(ChildrenRunAfterParentInPriorityOrder) {
    NodeHandle parent = makeNode("parent", 0);
    NodeHandle sibling = makeNode("sibling", -1);
    NodeHandle childA = makeNode("childA", 1);
    NodeHandle childB = makeNode("childB", 3);
    scheduler.attach(parent);
    scheduler.attach(sibling);
    scheduler.attach(childA, parent);
    scheduler.attach(childB, parent);

    BOOST_CHECK(scheduler.getParent(childA) == parent);
    BOOST_CHECK(scheduler.isInState(childA));
    BOOST_CHECK_EQUAL(scheduler.getChildren(parent).size(), 2u);

    frames(1);

    const std::vector<std::string> expected{"parent", "childB", "childA", "sibling"};
    BOOST_CHECK_EQUAL_COLLECTIONS(log.begin(), log.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(PriorityChangeDuringPassWaitsForFlush) {
    NodeHandle first = makeNode("first", 10);
    NodeHandle second = makeNode("second", 5);
    scheduler.attach(first);
    scheduler.attach(second);

    int priorityDuringPass = 0;
    hooks(first).tick = [&](SimulationState&, NodeHandle) {
        log.push_back("first");
        if (state.getFrameCount() == 0) {
            scheduler.setPriority(second, 20);
            priorityDuringPass = scheduler.getPriority(second);
        }
    };

    frames(1);
    BOOST_CHECK_EQUAL(priorityDuringPass, 5);
    BOOST_CHECK_EQUAL(scheduler.getPriority(second), 20);
    BOOST_CHECK_EQUAL(scheduler.getPendingPriority(second), 20);

    frames(1);
    const std::vector<std::string> expected{"first", "second", "second", "first"};
    BOOST_CHECK_EQUAL_COLLECTIONS(log.begin(), log.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(UnattachedPriorityAppliesImmediately) {
    NodeHandle node = makeNode("node", 0);
    scheduler.setPriority(node, 7);
    BOOST_CHECK_EQUAL(scheduler.getPriority(node), 7);
    BOOST_CHECK_EQUAL(scheduler.getPendingPriority(node), 7);
}

BOOST_AUTO_TEST_CASE(AttachOutsidePassIsImmediate) {
    NodeHandle node = makeNode("node");
    int added = 0;
    hooks(node).added = [&](SimulationState&, NodeHandle) { ++added; };

    scheduler.attach(node);
    BOOST_CHECK_EQUAL(added, 1);
    BOOST_CHECK(scheduler.isAttached(node));
    BOOST_CHECK(scheduler.getMembership(node) == NodeMembership::Attached);

    BOOST_CHECK(scheduler.detach(node));
    BOOST_CHECK(scheduler.getMembership(node) == NodeMembership::Detached);
    BOOST_CHECK(!scheduler.detach(node));
}

BOOST_AUTO_TEST_CASE(SelfDetachInTickIsDeferred) {
    NodeHandle node = makeNode("node");
    int removed = 0;
    NodeMembership duringPass = NodeMembership::Detached;
    hooks(node).removed = [&](SimulationState&, NodeHandle) { ++removed; };
    hooks(node).tick = [&](SimulationState&, NodeHandle self) {
        log.push_back("node");
        scheduler.detach(self);
        duringPass = scheduler.getMembership(self);
    };
    scheduler.attach(node);

    frames(1);
    BOOST_CHECK(duringPass == NodeMembership::PendingDetach);
    BOOST_CHECK_EQUAL(removed, 1);
    BOOST_CHECK(!scheduler.isAttached(node));

    frames(3);
    BOOST_CHECK_EQUAL(log.size(), 1u);
}

BOOST_AUTO_TEST_CASE(InvalidAttachmentsThrow) {
    NodeHandle parent = makeNode("parent");
    NodeHandle child = makeNode("child");
    scheduler.attach(parent);
    scheduler.attach(child, parent);

    BOOST_CHECK_THROW(scheduler.attach(child), std::logic_error);
    BOOST_CHECK_THROW(scheduler.attach(parent, parent), std::logic_error);

    BOOST_CHECK(scheduler.detach(parent));
    BOOST_CHECK_THROW(scheduler.attach(parent, child), std::logic_error);

    NodeHandle stale = makeNode("stale");
    scheduler.destroyNode(stale);
    BOOST_CHECK_THROW(scheduler.attach(stale), std::out_of_range);
    BOOST_CHECK_THROW(scheduler.attach(makeNode("orphan"), stale), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(NodeAttachedDuringFramePassCatchesUp) {
    NodeHandle spawner = makeNode("spawner");
    NodeHandle late = makeNode("late");
    int lateFrames = 0;
    hooks(late).frame = [&](SimulationState&, NodeHandle) { ++lateFrames; };
    hooks(spawner).frame = [&](SimulationState&, NodeHandle) {
        if (!scheduler.isAttached(late) && scheduler.getMembership(late) == NodeMembership::Detached) {
            scheduler.attach(late);
        }
    };
    scheduler.attach(spawner);

    frames(1);
    BOOST_CHECK(scheduler.isAttached(late));
    BOOST_CHECK_EQUAL(lateFrames, 1);

    frames(1);
    BOOST_CHECK_EQUAL(lateFrames, 2);
}

BOOST_AUTO_TEST_CASE(NodeAttachedDuringTickPassGetsFrameHookOnce) {
    NodeHandle spawner = makeNode("spawner");
    NodeHandle parent = makeNode("parent");
    NodeHandle child = makeNode("child");
    int childFrames = 0;
    hooks(child).frame = [&](SimulationState&, NodeHandle) { ++childFrames; };
    scheduler.attach(child, parent);
    hooks(spawner).tick = [&](SimulationState&, NodeHandle) {
        if (scheduler.getMembership(parent) == NodeMembership::Detached) {
            scheduler.attach(parent);
        }
    };
    scheduler.attach(spawner);

    frames(1);
    BOOST_CHECK(scheduler.isInState(child));
    BOOST_CHECK_EQUAL(childFrames, 1);
}

BOOST_AUTO_TEST_CASE(TimeFactorIsInheritedFromRootAncestor) {
    NodeHandle root = makeNode("root");
    NodeHandle child = makeNode("child");
    scheduler.attach(root);
    scheduler.attach(child, root);
    scheduler.setTimeFactor(child, Frac::fromInt(10)); // ignored below the root

    state.setTimeFactor(Frac::fromInt(2));
    BOOST_CHECK_EQUAL(scheduler.getEffectiveTimeFactor(child), Frac::fromInt(2));
    frames(1);
    BOOST_CHECK_EQUAL(log.size(), 4u);

    log.clear();
    scheduler.setTimeFactor(root, Frac::UNIT / 2);
    BOOST_CHECK_EQUAL(scheduler.getEffectiveTimeFactor(child), Frac::UNIT / 2);
    frames(4);
    BOOST_CHECK_EQUAL(log.size(), 4u); // two ticks of root and child each
}

BOOST_AUTO_TEST_CASE(NoTimePassesOutsideActiveState) {
    NodeHandle node = makeNode("node");
    scheduler.attach(node);

    state.pause();
    BOOST_CHECK_EQUAL(scheduler.getEffectiveTimeFactor(node), 0);
    frames(3);
    BOOST_CHECK(log.empty());

    state.resume();
    frames(1);
    BOOST_CHECK_EQUAL(log.size(), 1u);

    NodeHandle detached = makeNode("detached");
    BOOST_CHECK_EQUAL(scheduler.getEffectiveTimeFactor(detached), 0);
}

BOOST_AUTO_TEST_CASE(TickCountIndependentOfFrameSplit) {
    SimulationState other{"OtherState"};
    other.enter();
    auto countTicks = [](SimulationState& s, int& counter) {
        auto behavior = std::make_unique<CallbackBehavior>("counter");
        behavior->tick = [&counter](SimulationState&, NodeHandle) { ++counter; };
        NodeHandle node = s.getScheduler().createNode(std::move(behavior));
        s.getScheduler().setTimeFactor(node, Frac::fromDouble(0.3));
        s.getScheduler().attach(node);
        return node;
    };

    int fineTicks = 0;
    int coarseTicks = 0;
    NodeHandle fine = countTicks(state, fineTicks);
    NodeHandle coarse = countTicks(other, coarseTicks);

    for (int i = 0; i < 10; ++i) {
        state.advanceFrame(FRAME);
    }
    for (int i = 0; i < 5; ++i) {
        other.advanceFrame(2.0 * FRAME);
    }

    BOOST_CHECK_EQUAL(fineTicks, 2);
    BOOST_CHECK_EQUAL(fineTicks, coarseTicks);
    BOOST_CHECK_EQUAL(scheduler.getLeftoverTime(fine),
                      other.getScheduler().getLeftoverTime(coarse));
}

BOOST_AUTO_TEST_CASE(OddTimeFactorKeepsTicksAcrossFrameSplits) {
    // 1229 * UNIT / 4 is not a whole number of units, so each quarter frame
    // leaves a fraction of a unit behind that must not be dropped
    SimulationState halves{"HalfFrames"};
    SimulationState quarters{"QuarterFrames"};
    halves.enter();
    quarters.enter();
    auto countTicks = [](SimulationState& s, int& counter) {
        auto behavior = std::make_unique<CallbackBehavior>("counter");
        behavior->tick = [&counter](SimulationState&, NodeHandle) { ++counter; };
        NodeHandle node = s.getScheduler().createNode(std::move(behavior));
        s.getScheduler().setTimeFactor(node, 1229);
        s.getScheduler().attach(node);
        return node;
    };

    int wholeTicks = 0;
    int halfTicks = 0;
    int quarterTicks = 0;
    NodeHandle whole = countTicks(state, wholeTicks);
    NodeHandle half = countTicks(halves, halfTicks);
    NodeHandle quarter = countTicks(quarters, quarterTicks);

    for (int i = 0; i < 4096; ++i) {
        state.advanceFrame(FRAME);
    }
    for (int i = 0; i < 2 * 4096; ++i) {
        halves.advanceFrame(FRAME / 2.0);
    }
    for (int i = 0; i < 4 * 4096; ++i) {
        quarters.advanceFrame(FRAME / 4.0);
    }

    BOOST_CHECK_EQUAL(wholeTicks, 1229);
    BOOST_CHECK_EQUAL(halfTicks, wholeTicks);
    BOOST_CHECK_EQUAL(quarterTicks, wholeTicks);
    BOOST_CHECK_EQUAL(scheduler.getLeftoverTime(whole), 0);
    BOOST_CHECK_EQUAL(halves.getScheduler().getLeftoverTime(half), 0);
    BOOST_CHECK_EQUAL(quarters.getScheduler().getLeftoverTime(quarter), 0);
}

BOOST_AUTO_TEST_CASE(DestroyFreesSubtree) {
    NodeHandle parent = makeNode("parent");
    NodeHandle child = makeNode("child");
    NodeHandle grandchild = makeNode("grandchild");
    int parentRemoved = 0;
    hooks(parent).removed = [&](SimulationState&, NodeHandle) { ++parentRemoved; };
    scheduler.attach(parent);
    scheduler.attach(child, parent);
    scheduler.attach(grandchild, child);
    BOOST_CHECK_EQUAL(scheduler.getNodeCount(), 3u);

    BOOST_CHECK(scheduler.destroyNode(parent));
    BOOST_CHECK_EQUAL(parentRemoved, 1);
    BOOST_CHECK(!scheduler.isAlive(parent));
    BOOST_CHECK(!scheduler.isAlive(child));
    BOOST_CHECK(!scheduler.isAlive(grandchild));
    BOOST_CHECK_EQUAL(scheduler.getNodeCount(), 0u);
    BOOST_CHECK(scheduler.getChildren().empty());
    BOOST_CHECK(!scheduler.destroyNode(parent));
}

BOOST_AUTO_TEST_CASE(DestroyInsideHookWaitsForFlush) {
    NodeHandle killer = makeNode("killer", 10);
    NodeHandle victim = makeNode("victim", 0);
    bool aliveDuringPass = false;
    hooks(killer).tick = [&](SimulationState&, NodeHandle) {
        if (scheduler.isAlive(victim)) {
            scheduler.destroyNode(victim);
            aliveDuringPass = scheduler.isAlive(victim);
        }
    };
    scheduler.attach(killer);
    scheduler.attach(victim);

    frames(1);
    BOOST_CHECK(aliveDuringPass);
    BOOST_CHECK(!scheduler.isAlive(victim));
    BOOST_CHECK_EQUAL(scheduler.getChildren().size(), 1u);
}

BOOST_AUTO_TEST_CASE(AttachCancelledByDestroyInSamePassRunsNoHooks) {
    NodeHandle spawner = makeNode("spawner");
    NodeHandle spawned;
    int added = 0;
    int removed = 0;
    hooks(spawner).tick = [&](SimulationState&, NodeHandle) {
        if (spawned.isValid()) {
            return;
        }
        auto behavior = std::make_unique<CallbackBehavior>("spawned");
        behavior->added = [&](SimulationState&, NodeHandle) { ++added; };
        behavior->removed = [&](SimulationState&, NodeHandle) { ++removed; };
        spawned = scheduler.createNode(std::move(behavior));
        scheduler.attach(spawned);
        scheduler.destroyNode(spawned);
    };
    scheduler.attach(spawner);

    frames(1);
    BOOST_CHECK_EQUAL(added, 0);
    BOOST_CHECK_EQUAL(removed, 0);
    BOOST_CHECK(!scheduler.isAlive(spawned));
    BOOST_CHECK_EQUAL(scheduler.getChildren().size(), 1u);
}

BOOST_AUTO_TEST_CASE(DetachThenReattachInSamePassKeepsMembership) {
    NodeHandle mover = makeNode("mover", 10);
    NodeHandle node = makeNode("node");
    int added = 0;
    int removed = 0;
    hooks(node).added = [&](SimulationState&, NodeHandle) { ++added; };
    hooks(node).removed = [&](SimulationState&, NodeHandle) { ++removed; };
    hooks(mover).tick = [&](SimulationState&, NodeHandle) {
        scheduler.detach(node);
        scheduler.attach(node);
    };
    scheduler.attach(mover);
    scheduler.attach(node);
    BOOST_REQUIRE_EQUAL(added, 1);

    frames(1);
    BOOST_CHECK_EQUAL(added, 1);
    BOOST_CHECK_EQUAL(removed, 0);
    BOOST_CHECK(scheduler.getMembership(node) == NodeMembership::Attached);
    BOOST_CHECK_EQUAL(scheduler.getChildren().size(), 2u);
}

BOOST_AUTO_TEST_CASE(StaleHandlesAreRejected) {
    NodeHandle first = makeNode("first");
    scheduler.destroyNode(first);
    NodeHandle reused = makeNode("reused");

    BOOST_CHECK_EQUAL(reused.index, first.index);
    BOOST_CHECK_NE(reused.generation, first.generation);
    BOOST_CHECK(!scheduler.isAlive(first));
    BOOST_CHECK(scheduler.isAlive(reused));
    BOOST_CHECK_THROW(scheduler.getPriority(first), std::out_of_range);
    BOOST_CHECK_THROW(scheduler.getPriority(NodeHandle{}), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(TimersSetDuringTickFireAtTheRightPass) {
    NodeHandle node = makeNode("node");
    auto now = std::make_shared<TimedEvent>([&]() { log.push_back("now"); }, "now");
    auto next = std::make_shared<TimedEvent>([&]() { log.push_back("next"); }, "next");
    int tick = 0;
    hooks(node).tick = [&](SimulationState&, NodeHandle self) {
        log.push_back("tick" + std::to_string(++tick));
        if (tick == 1) {
            scheduler.setTimer(self, now, 0);
            scheduler.setTimer(self, next, 1);
        }
    };
    scheduler.attach(node);

    frames(2);

    const std::vector<std::string> expected{"tick1", "now", "next", "tick2"};
    BOOST_CHECK_EQUAL_COLLECTIONS(log.begin(), log.end(), expected.begin(), expected.end());
    BOOST_CHECK_EQUAL(scheduler.getTimer(node, now), -1);
    BOOST_CHECK_EQUAL(scheduler.getTimer(node, next), 0);
}

BOOST_AUTO_TEST_SUITE_END()
