/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/AgentAnimator.hpp"
#include <cmath>

AnimationSelection selectAnimation(AgentStateId state, HordeEngine::DistanceTier tier) {
  AnimationSelection selection;
  selection.advance = (tier == HordeEngine::DistanceTier::Near);

  switch (state) {
  case AgentStateId::Idle:
    selection.cue = "idle";
    break;
  case AgentStateId::Chase:
    selection.cue = "walk";
    selection.speed = 1.2f;
    break;
  case AgentStateId::Attack:
    selection.cue = "attack";
    selection.loop = false;
    break;
  case AgentStateId::Death:
    selection.cue = "death";
    selection.loop = false;
    break;
  }
  return selection;
}

void AgentAnimator::addClip(const std::string& name,
                            std::shared_ptr<const HordeEngine::AnimationClip> clip) {
  if (clip) {
    m_clips[name] = std::move(clip);
  }
}

bool AgentAnimator::hasClip(const std::string& name) const {
  return m_clips.find(name) != m_clips.end();
}

void AgentAnimator::clearClips() {
  m_clips.clear();
  m_currentClip.clear();
  m_time = 0.0f;
  m_finished = false;
}

AgentAnimator::ResolvedClip AgentAnimator::resolve(const std::string& cue, float speed) const {
  ResolvedClip resolved{cue, speed};

  if (cue == "idle" && !hasClip("idle")) {
    resolved = {"walk", 0.25f};
  } else if (cue == "run" && !hasClip("run")) {
    resolved = {"walk", 1.5f};
  }

  if (!hasClip(resolved.name)) {
    resolved.name = "walk";
    if (!hasClip(resolved.name)) {
      resolved.name.clear();
    }
  }
  return resolved;
}

void AgentAnimator::apply(const AnimationSelection& selection, float deltaTime) {
  ResolvedClip resolved = resolve(selection.cue, selection.speed);

  if (resolved.name != m_currentClip) {
    m_currentClip = resolved.name;
    m_time = 0.0f;
    m_finished = false;
  }
  m_speed = resolved.speed;
  m_loop = selection.loop;

  if (m_currentClip.empty() || !selection.advance || m_finished) {
    return;
  }

  const float duration = m_clips.at(m_currentClip)->duration;
  m_time += deltaTime * m_speed;

  if (duration <= 0.0f) {
    return;
  }
  if (m_loop) {
    m_time = std::fmod(m_time, duration);
  } else if (m_time >= duration) {
    // Play-once clips hold their last frame
    m_time = duration;
    m_finished = true;
  }
}

void AgentAnimator::restart() {
  m_time = 0.0f;
  m_finished = false;
}
