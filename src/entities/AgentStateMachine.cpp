/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/AgentStateMachine.hpp"
#include "core/Logger.hpp"
#include <format>
#include <stdexcept>
#include <string>

const char* toString(AgentStateId id) {
  switch (id) {
  case AgentStateId::Idle:
    return "idle";
  case AgentStateId::Chase:
    return "chase";
  case AgentStateId::Attack:
    return "attack";
  case AgentStateId::Death:
    return "death";
  }
  return "unknown";
}

AgentStateMachine::~AgentStateMachine() {
  m_currentState = nullptr;
}

void AgentStateMachine::addState(AgentStateId id, std::unique_ptr<EntityState> state) {
  if (m_states.find(id) != m_states.end()) {
    ENTITYSTATE_ERROR(std::format("State already exists: {}", toString(id)));
    throw std::invalid_argument(std::format("Horde Engine - State already exists: {}", toString(id)));
  }
  m_states[id] = std::move(state);
}

bool AgentStateMachine::setState(AgentStateId id) {
  auto it = m_states.find(id);
  if (it == m_states.end()) {
    ENTITYSTATE_ERROR(std::format("State not found: {}", toString(id)));
    return false;
  }

  if (m_currentState == it->second.get()) {
    return true;
  }

  if (m_currentState) {
    m_currentState->exit();
  }

  m_currentState = it->second.get();
  m_currentId = id;
  m_currentState->enter();
  return true;
}

bool AgentStateMachine::hasState(AgentStateId id) const {
  return m_states.find(id) != m_states.end();
}

void AgentStateMachine::update(float deltaTime) {
  if (m_currentState) {
    m_currentState->update(deltaTime);
  }
}

void AgentStateMachine::reset() {
  if (m_currentState) {
    m_currentState->exit();
  }
  m_currentState = nullptr;
}
