/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE GameStateManagerTests
#include <boost/test/unit_test.hpp>
#include "managers/GameStateManager.hpp"
#include "gameStates/GameState.hpp"
#include "gameStates/SimulationState.hpp"
#include <memory>
#include <stdexcept>
#include <string>

// Mock GameState for testing
class MockGameState : public GameState {
public:
    explicit MockGameState(const std::string& name) : m_name(name) {}

    bool enter() override {
        m_enterCalled = true;
        return true;
    }

    void update(float deltaTime) override {
        m_updateCalled = true;
        m_lastDeltaTime = deltaTime;
    }

    void render(SDL_Renderer*, float interpolationAlpha) override {
        m_renderCalled = true;
        m_lastAlpha = interpolationAlpha;
    }

    bool exit() override {
        m_exitCalled = true;
        return true;
    }

    void pause() override { m_pauseCalled = true; }
    void resume() override { m_resumeCalled = true; }

    std::string getName() const override { return m_name; }

    // Test helper methods
    bool wasEnterCalled() const { return m_enterCalled; }
    bool wasExitCalled() const { return m_exitCalled; }
    bool wasUpdateCalled() const { return m_updateCalled; }
    bool wasRenderCalled() const { return m_renderCalled; }
    bool wasPauseCalled() const { return m_pauseCalled; }
    bool wasResumeCalled() const { return m_resumeCalled; }
    float getLastDeltaTime() const { return m_lastDeltaTime; }
    float getLastAlpha() const { return m_lastAlpha; }

    void resetFlags() {
        m_enterCalled = m_exitCalled = m_updateCalled = m_renderCalled =
        m_pauseCalled = m_resumeCalled = false;
    }

private:
    std::string m_name;
    bool m_enterCalled{false};
    bool m_exitCalled{false};
    bool m_updateCalled{false};
    bool m_renderCalled{false};
    bool m_pauseCalled{false};
    bool m_resumeCalled{false};
    float m_lastDeltaTime{0.0f};
    float m_lastAlpha{0.0f};
};

struct GameStateManagerFixture {
    GameStateManager manager;
};

BOOST_FIXTURE_TEST_SUITE(GameStateManagerTestSuite, GameStateManagerFixture)

BOOST_AUTO_TEST_CASE(TestInitialState) {
    BOOST_CHECK(!manager.hasState("nonexistent"));
    BOOST_CHECK(manager.getState("nonexistent") == nullptr);
    BOOST_CHECK(manager.getCurrentState() == nullptr);
    BOOST_CHECK_EQUAL(manager.getActiveStateCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestAddState) {
    auto mockState = std::make_unique<MockGameState>("TestState");
    MockGameState* statePtr = mockState.get();
    manager.addState(std::move(mockState));

    // Registered but not active
    BOOST_CHECK(manager.hasState("TestState"));
    BOOST_CHECK_EQUAL(manager.getState("TestState")->getName(), "TestState");
    BOOST_CHECK(!statePtr->wasEnterCalled());
    BOOST_CHECK(statePtr->getStateManager() == &manager);
}

BOOST_AUTO_TEST_CASE(TestAddInvalidStates) {
    manager.addState(std::make_unique<MockGameState>("TestState"));
    BOOST_CHECK_THROW(manager.addState(std::make_unique<MockGameState>("TestState")),
                      std::runtime_error);
    BOOST_CHECK_THROW(manager.addState(nullptr), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestPushAndPop) {
    auto mockState = std::make_unique<MockGameState>("TestState");
    MockGameState* statePtr = mockState.get();
    manager.addState(std::move(mockState));

    manager.pushState("TestState");
    BOOST_CHECK(statePtr->wasEnterCalled());
    BOOST_CHECK_EQUAL(manager.getCurrentState()->getName(), "TestState");

    manager.popState();
    BOOST_CHECK(statePtr->wasExitCalled());
    BOOST_CHECK_EQUAL(manager.getActiveStateCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestMissingStatesDoNotThrow) {
    BOOST_CHECK_NO_THROW(manager.pushState("NonexistentState"));
    BOOST_CHECK_NO_THROW(manager.popState());
    BOOST_CHECK_NO_THROW(manager.removeState("NonexistentState"));
    BOOST_CHECK_NO_THROW(manager.update(0.016f));
    BOOST_CHECK_NO_THROW(manager.render(nullptr));
}

BOOST_AUTO_TEST_CASE(TestChangeState) {
    auto mockState1 = std::make_unique<MockGameState>("State1");
    auto mockState2 = std::make_unique<MockGameState>("State2");
    MockGameState* state1Ptr = mockState1.get();
    MockGameState* state2Ptr = mockState2.get();
    manager.addState(std::move(mockState1));
    manager.addState(std::move(mockState2));

    manager.pushState("State1");
    state1Ptr->resetFlags();

    manager.changeState("State2");
    BOOST_CHECK(state1Ptr->wasExitCalled());
    BOOST_CHECK(state2Ptr->wasEnterCalled());
    BOOST_CHECK_EQUAL(manager.getActiveStateCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestUpdateAndRenderReachWholeStack) {
    auto mockState1 = std::make_unique<MockGameState>("State1");
    auto mockState2 = std::make_unique<MockGameState>("State2");
    MockGameState* state1Ptr = mockState1.get();
    MockGameState* state2Ptr = mockState2.get();
    manager.addState(std::move(mockState1));
    manager.addState(std::move(mockState2));
    manager.pushState("State1");
    manager.pushState("State2");

    BOOST_CHECK(state1Ptr->wasPauseCalled());

    const float deltaTime = 0.016f;
    manager.update(deltaTime);
    manager.render(nullptr, 0.5f);

    BOOST_CHECK(state1Ptr->wasUpdateCalled());
    BOOST_CHECK(state2Ptr->wasUpdateCalled());
    BOOST_CHECK_EQUAL(state2Ptr->getLastDeltaTime(), deltaTime);
    BOOST_CHECK(state1Ptr->wasRenderCalled());
    BOOST_CHECK_EQUAL(state2Ptr->getLastAlpha(), 0.5f);

    manager.popState();
    BOOST_CHECK(state2Ptr->wasExitCalled());
    BOOST_CHECK(state1Ptr->wasResumeCalled());
}

BOOST_AUTO_TEST_CASE(TestRemoveState) {
    manager.addState(std::make_unique<MockGameState>("State1"));
    manager.addState(std::make_unique<MockGameState>("State2"));
    manager.pushState("State1");
    manager.pushState("State2");

    auto state1Shared = std::dynamic_pointer_cast<MockGameState>(manager.getState("State1"));
    auto state2Shared = std::dynamic_pointer_cast<MockGameState>(manager.getState("State2"));
    BOOST_REQUIRE(state1Shared != nullptr);
    BOOST_REQUIRE(state2Shared != nullptr);
    state1Shared->resetFlags();

    manager.removeState("State2");
    BOOST_CHECK(state2Shared->wasExitCalled());
    BOOST_CHECK(state1Shared->wasResumeCalled());
    BOOST_CHECK(!manager.hasState("State2"));
}

BOOST_AUTO_TEST_CASE(TestRemoveCoveredStateLeavesTopRunning) {
    manager.addState(std::make_unique<MockGameState>("Below"));
    manager.addState(std::make_unique<MockGameState>("Top"));
    manager.pushState("Below");
    manager.pushState("Top");

    auto topShared = std::dynamic_pointer_cast<MockGameState>(manager.getState("Top"));
    BOOST_REQUIRE(topShared != nullptr);
    topShared->resetFlags();

    BOOST_CHECK(manager.removeState("Below"));
    BOOST_CHECK(!topShared->wasResumeCalled());
    BOOST_CHECK_EQUAL(manager.getCurrentState()->getName(), "Top");
    BOOST_CHECK_EQUAL(manager.getActiveStateCount(), 1u);
    BOOST_CHECK(!manager.removeState("Below"));
}

BOOST_AUTO_TEST_CASE(TestStateCannotBeStackedTwice) {
    manager.addState(std::make_unique<MockGameState>("Once"));
    BOOST_CHECK(manager.pushState("Once"));
    BOOST_CHECK(!manager.pushState("Once"));
    BOOST_CHECK_EQUAL(manager.getActiveStateCount(), 1u);
    BOOST_CHECK(manager.isStateActive("Once"));
    BOOST_CHECK(!manager.changeState("Missing"));
    BOOST_CHECK(manager.isStateActive("Once"));
}

BOOST_AUTO_TEST_CASE(TestClearAllStates) {
    manager.addState(std::make_unique<MockGameState>("State1"));
    manager.addState(std::make_unique<MockGameState>("State2"));
    manager.pushState("State1");
    manager.pushState("State2");

    auto state1Shared = std::dynamic_pointer_cast<MockGameState>(manager.getState("State1"));
    auto state2Shared = std::dynamic_pointer_cast<MockGameState>(manager.getState("State2"));

    manager.clearAllStates();
    BOOST_CHECK(state1Shared->wasExitCalled());
    BOOST_CHECK(state2Shared->wasExitCalled());
    BOOST_CHECK(!manager.hasState("State1"));
    BOOST_CHECK_EQUAL(manager.getActiveStateCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestCoveredSimulationStopsAdvancing) {
    auto simulation = std::make_unique<SimulationState>("Simulation");
    SimulationState* simPtr = simulation.get();
    manager.addState(std::move(simulation));
    manager.addState(std::make_unique<MockGameState>("Overlay"));

    manager.pushState("Simulation");
    BOOST_CHECK(simPtr->isActive());
    manager.update(1.0f / 60.0f);
    BOOST_CHECK_EQUAL(simPtr->getFrameCount(), 1u);

    manager.pushState("Overlay");
    BOOST_CHECK(!simPtr->isActive());
    manager.update(1.0f / 60.0f);
    BOOST_CHECK_EQUAL(simPtr->getFrameCount(), 1u);

    manager.popState();
    manager.update(1.0f / 60.0f);
    BOOST_CHECK_EQUAL(simPtr->getFrameCount(), 2u);

    manager.popState();
    BOOST_CHECK(!simPtr->isEntered());
}

BOOST_AUTO_TEST_SUITE_END()
