/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_CHASE_STATE_HPP
#define AGENT_CHASE_STATE_HPP

#include "entities/EntityState.hpp"
#include <functional>

class Agent;

class AgentChaseState : public EntityState {
public:
    explicit AgentChaseState(Agent& agent);

    void enter() override;
    void update(float deltaTime) override;
    void exit() override;

private:
    // Non-owning reference to the agent entity
    // The agent owns its state machine, and with it this state
    std::reference_wrapper<Agent> m_agent;
};

#endif // AGENT_CHASE_STATE_HPP
