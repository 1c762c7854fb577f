/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef AGENT_STATE_MACHINE_HPP
#define AGENT_STATE_MACHINE_HPP

#include "entities/EntityState.hpp"
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <memory>

enum class AgentStateId : uint8_t {
  Idle,
  Chase,
  Attack,
  Death
};

const char* toString(AgentStateId id);

class AgentStateMachine {

 public:
  AgentStateMachine() = default;
  ~AgentStateMachine();

  AgentStateMachine(const AgentStateMachine&) = delete;
  AgentStateMachine& operator=(const AgentStateMachine&) = delete;

  // Throws std::invalid_argument if the id is already registered
  void addState(AgentStateId id, std::unique_ptr<EntityState> state);

  /**
   * Exits the current state and enters the new one.
   * Setting the state that is already current does nothing.
   * @return false if the id was never registered (current state unchanged)
   */
  bool setState(AgentStateId id);

  AgentStateId getCurrentStateId() const { return m_currentId; }
  bool hasCurrentState() const { return m_currentState != nullptr; }
  bool hasState(AgentStateId id) const;
  void update(float deltaTime);

  // Exits the current state without entering another
  void reset();

 private:
  boost::container::flat_map<AgentStateId, std::unique_ptr<EntityState>> m_states;
  // Non-owning pointer to the current active state
  // This state is owned by the 'm_states' container above
  EntityState* m_currentState{nullptr};
  AgentStateId m_currentId{AgentStateId::Idle};
};

#endif  // AGENT_STATE_MACHINE_HPP
