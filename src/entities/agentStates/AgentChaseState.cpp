/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/agentStates/AgentChaseState.hpp"
#include "entities/Agent.hpp"

AgentChaseState::AgentChaseState(Agent& agent) : m_agent(agent) {}

void AgentChaseState::enter() {
    // Velocity is set on the first update once a heading exists
}

void AgentChaseState::update(float deltaTime) {
    m_agent.get().processChase(deltaTime);
}

void AgentChaseState::exit() {
}
