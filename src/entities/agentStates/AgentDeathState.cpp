/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/agentStates/AgentDeathState.hpp"
#include "entities/Agent.hpp"

AgentDeathState::AgentDeathState(Agent& agent) : m_agent(agent) {}

void AgentDeathState::enter() {
    // Alive flag drops immediately and all movement stops
    m_agent.get().markDead();
}

void AgentDeathState::update(float deltaTime) {
    (void)deltaTime;
    // Terminal; removal is handled by the population pruner
}

void AgentDeathState::exit() {
}
