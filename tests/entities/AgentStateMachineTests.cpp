/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE AgentStateMachineTests
#include <boost/test/unit_test.hpp>

#include "entities/AgentStateMachine.hpp"
#include "entities/EntityState.hpp"
#include <memory>
#include <stdexcept>
#include <string>

// Mock EntityState that tracks lifecycle calls
class MockEntityState : public EntityState {
public:
    int enterCount = 0;
    int exitCount = 0;
    int updateCount = 0;
    float lastDeltaTime = 0.0f;

    void enter() override { ++enterCount; }
    void exit() override { ++exitCount; }
    void update(float deltaTime) override {
        ++updateCount;
        lastDeltaTime = deltaTime;
    }
};

// Helper to create mock states for tests
std::unique_ptr<MockEntityState> createMockState() {
    return std::make_unique<MockEntityState>();
}

// ============================================================================
// Basic State Management Tests
// ============================================================================

BOOST_AUTO_TEST_CASE(AddState) {
    AgentStateMachine machine;

    machine.addState(AgentStateId::Idle, createMockState());

    BOOST_CHECK(machine.hasState(AgentStateId::Idle));
    BOOST_CHECK(!machine.hasCurrentState());  // Not set yet
}

BOOST_AUTO_TEST_CASE(AddDuplicateStateThrows) {
    AgentStateMachine machine;

    machine.addState(AgentStateId::Idle, createMockState());

    BOOST_CHECK_THROW(machine.addState(AgentStateId::Idle, createMockState()),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(DuplicateStateErrorNamesTheState) {
    AgentStateMachine machine;

    machine.addState(AgentStateId::Attack, createMockState());

    BOOST_CHECK_EXCEPTION(machine.addState(AgentStateId::Attack, createMockState()),
                          std::invalid_argument,
                          [](const std::invalid_argument& e) {
                              return std::string(e.what()) ==
                                     "Horde Engine - State already exists: attack";
                          });
}

BOOST_AUTO_TEST_CASE(HasStateReturnsFalseForUnregistered) {
    AgentStateMachine machine;

    machine.addState(AgentStateId::Idle, createMockState());

    BOOST_CHECK(!machine.hasState(AgentStateId::Attack));
    BOOST_CHECK(!machine.hasState(AgentStateId::Death));
}

// ============================================================================
// State Transition Tests
// ============================================================================

BOOST_AUTO_TEST_CASE(SetStateCallsEnter) {
    AgentStateMachine machine;

    auto state = std::make_unique<MockEntityState>();
    MockEntityState* statePtr = state.get();
    machine.addState(AgentStateId::Idle, std::move(state));

    BOOST_CHECK(machine.setState(AgentStateId::Idle));

    BOOST_CHECK_EQUAL(statePtr->enterCount, 1);
    BOOST_CHECK_EQUAL(statePtr->exitCount, 0);
    BOOST_CHECK(machine.getCurrentStateId() == AgentStateId::Idle);
}

BOOST_AUTO_TEST_CASE(SetStateTransitionCallsExitThenEnter) {
    AgentStateMachine machine;

    auto idleState = std::make_unique<MockEntityState>();
    auto chaseState = std::make_unique<MockEntityState>();
    MockEntityState* idlePtr = idleState.get();
    MockEntityState* chasePtr = chaseState.get();

    machine.addState(AgentStateId::Idle, std::move(idleState));
    machine.addState(AgentStateId::Chase, std::move(chaseState));

    machine.setState(AgentStateId::Idle);
    machine.setState(AgentStateId::Chase);

    BOOST_CHECK_EQUAL(idlePtr->exitCount, 1);
    BOOST_CHECK_EQUAL(chasePtr->enterCount, 1);
    BOOST_CHECK(machine.getCurrentStateId() == AgentStateId::Chase);
}

BOOST_AUTO_TEST_CASE(SetSameStateIsNoOp) {
    AgentStateMachine machine;

    auto state = std::make_unique<MockEntityState>();
    MockEntityState* statePtr = state.get();
    machine.addState(AgentStateId::Idle, std::move(state));

    machine.setState(AgentStateId::Idle);
    machine.setState(AgentStateId::Idle);

    BOOST_CHECK_EQUAL(statePtr->enterCount, 1);
    BOOST_CHECK_EQUAL(statePtr->exitCount, 0);
}

BOOST_AUTO_TEST_CASE(SetUnknownStateKeepsCurrent) {
    AgentStateMachine machine;

    auto state = std::make_unique<MockEntityState>();
    MockEntityState* statePtr = state.get();
    machine.addState(AgentStateId::Idle, std::move(state));
    machine.setState(AgentStateId::Idle);

    BOOST_CHECK(!machine.setState(AgentStateId::Death));

    BOOST_CHECK_EQUAL(statePtr->exitCount, 0);
    BOOST_CHECK(machine.getCurrentStateId() == AgentStateId::Idle);
}

// ============================================================================
// Update Tests
// ============================================================================

BOOST_AUTO_TEST_CASE(UpdateForwardsDeltaToCurrentStateOnly) {
    AgentStateMachine machine;

    auto idleState = std::make_unique<MockEntityState>();
    auto chaseState = std::make_unique<MockEntityState>();
    MockEntityState* idlePtr = idleState.get();
    MockEntityState* chasePtr = chaseState.get();
    machine.addState(AgentStateId::Idle, std::move(idleState));
    machine.addState(AgentStateId::Chase, std::move(chaseState));

    machine.setState(AgentStateId::Chase);
    machine.update(0.016f);

    BOOST_CHECK_EQUAL(idlePtr->updateCount, 0);
    BOOST_CHECK_EQUAL(chasePtr->updateCount, 1);
    BOOST_CHECK_CLOSE(chasePtr->lastDeltaTime, 0.016f, 0.001f);
}

BOOST_AUTO_TEST_CASE(UpdateWithoutCurrentStateIsSafe) {
    AgentStateMachine machine;
    machine.addState(AgentStateId::Idle, createMockState());

    BOOST_CHECK_NO_THROW(machine.update(0.016f));
}

BOOST_AUTO_TEST_CASE(ResetExitsCurrentState) {
    AgentStateMachine machine;

    auto state = std::make_unique<MockEntityState>();
    MockEntityState* statePtr = state.get();
    machine.addState(AgentStateId::Idle, std::move(state));
    machine.setState(AgentStateId::Idle);

    machine.reset();

    BOOST_CHECK_EQUAL(statePtr->exitCount, 1);
    BOOST_CHECK(!machine.hasCurrentState());
}

BOOST_AUTO_TEST_CASE(StateNames) {
    BOOST_CHECK_EQUAL(std::string(toString(AgentStateId::Idle)), "idle");
    BOOST_CHECK_EQUAL(std::string(toString(AgentStateId::Chase)), "chase");
    BOOST_CHECK_EQUAL(std::string(toString(AgentStateId::Attack)), "attack");
    BOOST_CHECK_EQUAL(std::string(toString(AgentStateId::Death)), "death");
}
