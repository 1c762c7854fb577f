/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/agentStates/AgentIdleState.hpp"
#include "entities/Agent.hpp"

AgentIdleState::AgentIdleState(Agent& agent) : m_agent(agent) {}

void AgentIdleState::enter() {
    // Standing still; vertical motion stays with physics
    m_agent.get().zeroHorizontalVelocity();
}

void AgentIdleState::update(float deltaTime) {
    m_agent.get().processIdle(deltaTime);
}

void AgentIdleState::exit() {
    // Nothing to release
}
