/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/agentStates/AgentAttackState.hpp"
#include "entities/Agent.hpp"

AgentAttackState::AgentAttackState(Agent& agent) : m_agent(agent) {}

void AgentAttackState::enter() {
    // Plant feet while swinging
    m_agent.get().zeroHorizontalVelocity();
}

void AgentAttackState::update(float deltaTime) {
    m_agent.get().processAttack(deltaTime);
}

void AgentAttackState::exit() {
    // Scheduled hits re-check the state when they fire
}
