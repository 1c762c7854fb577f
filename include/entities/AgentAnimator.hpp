/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef AGENT_ANIMATOR_HPP
#define AGENT_ANIMATOR_HPP

#include "ai/DistanceTier.hpp"
#include "entities/AgentStateMachine.hpp"
#include "managers/IAssetProvider.hpp"
#include <boost/container/flat_map.hpp>
#include <memory>
#include <string>

/**
 * @brief What an agent should be playing for a given state and tier
 */
struct AnimationSelection {
  std::string cue;       // Requested clip name before fallback
  float speed{1.0f};
  bool loop{true};
  bool advance{true};    // False when the agent is too far to be worth animating
};

// Pure mapping; evaluated every tick
AnimationSelection selectAnimation(AgentStateId state, HordeEngine::DistanceTier tier);

/**
 * @brief Plays one clip at a time from the clips an agent managed to load
 *
 * Missing clips fall back to "walk": idle plays walk at 0.25x, run plays
 * walk at 1.5x, anything else plays walk at the requested speed. With no
 * walk clip nothing plays.
 */
class AgentAnimator {
 public:
  struct ResolvedClip {
    std::string name;   // Empty when nothing can play
    float speed{1.0f};
  };

  void addClip(const std::string& name, std::shared_ptr<const HordeEngine::AnimationClip> clip);
  bool hasClip(const std::string& name) const;
  size_t getClipCount() const { return m_clips.size(); }
  void clearClips();

  ResolvedClip resolve(const std::string& cue, float speed) const;

  /**
   * Switches clip when the resolved clip changes, then advances playback
   * when the selection asks for it.
   */
  void apply(const AnimationSelection& selection, float deltaTime);

  // Rewind the current clip (attack re-trigger)
  void restart();

  const std::string& getCurrentClip() const { return m_currentClip; }
  float getPlaybackTime() const { return m_time; }
  float getPlaybackSpeed() const { return m_speed; }
  bool isLooping() const { return m_loop; }
  bool isFinished() const { return m_finished; }

 private:
  boost::container::flat_map<std::string, std::shared_ptr<const HordeEngine::AnimationClip>> m_clips;
  std::string m_currentClip;
  float m_time{0.0f};
  float m_speed{1.0f};
  bool m_loop{true};
  bool m_finished{false};
};

#endif  // AGENT_ANIMATOR_HPP
