/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/PhaseController.hpp"
#include "core/Logger.hpp"
#include "events/SimulationEventSink.hpp"
#include "simulation/FormationAnimator.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace GlyphFlow {

void PhaseState::clearLyricOverrides() {
  maxConvergence = 1.0f;
  holdDurationOverride.reset();
  releaseSpeed = 1.0f;
  dissolveMode = DissolveMode::None;
  lastTextTime.reset();
}

void PhaseController::reset(size_t particleCount) {
  m_particleCount = particleCount;
  m_groupA = PhaseState{};
  m_groupB = PhaseState{};
  m_groupB.targetConvergence = FLOW_CONVERGENCE;
  m_splitIndex = particleCount;
  m_groupBPatternActive = false;
  m_pendingFlow.reset();
}

void PhaseController::split() {
  m_splitIndex = m_particleCount / 2;
  PHASE_DEBUG(std::format("Group split at {}", m_splitIndex));
}

void PhaseController::merge() {
  m_splitIndex = m_particleCount;
  m_groupBPatternActive = false;
  m_groupB = PhaseState{};
  m_groupB.targetConvergence = FLOW_CONVERGENCE;
}

void PhaseController::transition(ParticleGroup group, Phase to, const std::string &detail) {
  PhaseState &state = getState(group);
  const Phase from = state.phase;
  state.phase = to;
  if (m_eventSink) {
    m_eventSink->onPhaseChange(group, from, to, detail);
  }
}

std::optional<PendingFlowCommand> PhaseController::takePendingFlow() {
  std::optional<PendingFlowCommand> pending;
  pending.swap(m_pendingFlow);
  return pending;
}

void PhaseController::advanceConvergence(PhaseState &state, float upRate, float downRate) {
  const bool rising = state.targetConvergence > state.convergence;
  const float speed = rising ? upRate : downRate * state.releaseSpeed;
  state.convergence += (state.targetConvergence - state.convergence) * speed;
  state.convergence = std::clamp(state.convergence, 0.0f, std::max(state.maxConvergence, 0.0f));
}

void PhaseController::advanceSweep(PhaseState &state) {
  state.currentSweep += (state.sweepDirection - state.currentSweep) * SWEEP_EASE;
}

bool PhaseController::holdExpired(const PhaseState &state, float elapsedTime) const {
  if (state.phase != Phase::Text || !state.lastTextTime) {
    return false;
  }
  const float hold = state.holdDurationOverride.value_or(m_holdDuration);
  return elapsedTime - *state.lastTextTime > hold;
}

PhaseController::TickResult PhaseController::advance(float elapsedTime, const MacroParams &macro,
                                                     std::vector<float> &targets,
                                                     std::mt19937 &rng) {
  TickResult result;

  advanceConvergence(m_groupA, macro.convergenceUpRate * m_convUpScale,
                     macro.convergenceDownRate * m_convDnScale);
  advanceSweep(m_groupA);

  if (isSplit()) {
    PhaseState &b = m_groupB;
    advanceConvergence(b, macro.convergenceUpRate, macro.convergenceDownRate);
    advanceSweep(b);

    if (b.phase == Phase::Text && !b.lastTextTime) {
      b.lastTextTime = elapsedTime;
    }
    if (holdExpired(b, elapsedTime)) {
      b.targetConvergence = 0.0f;
      transition(ParticleGroup::B, Phase::Releasing,
                 std::format("held {:.2f}s", b.holdDurationOverride.value_or(m_holdDuration)));
    }
    if (b.phase == Phase::Releasing && b.convergence < RELEASE_THRESHOLD) {
      b.clearLyricOverrides();
      b.targetConvergence = FLOW_CONVERGENCE;
      transition(ParticleGroup::B, Phase::Flow);
      result.groupBReleased = true;
    }
  }

  PhaseState &a = m_groupA;
  if (a.formationPending && !a.characters.empty()) {
    if (!a.formationStartTime) {
      a.formationStartTime = elapsedTime;
    }
    const float elapsed = elapsedTime - *a.formationStartTime;
    if (FormationAnimator::updateReveal(a.animation, a.characters, elapsed, targets, rng)) {
      a.formationPending = false;
      result.groupAFormed = true;
      transition(ParticleGroup::A, Phase::Text,
                 std::format("formed {:.0f}ms", elapsed * 1000.0f));
    }
  }

  if (a.phase == Phase::Text && !a.lastTextTime) {
    a.lastTextTime = elapsedTime;
  }
  if (holdExpired(a, elapsedTime)) {
    a.targetConvergence = 0.0f;
    transition(ParticleGroup::A, Phase::Releasing,
               std::format("held {:.2f}s", a.holdDurationOverride.value_or(m_holdDuration)));
  }
  if (a.phase == Phase::Releasing && a.convergence < RELEASE_THRESHOLD) {
    a.clearLyricOverrides();
    a.characters.clear();
    a.formationPending = false;
    a.formationStartTime.reset();
    transition(ParticleGroup::A, Phase::Flow);
    result.groupAReleased = true;
  }

  return result;
}

} // namespace GlyphFlow
