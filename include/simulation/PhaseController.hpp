/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHASE_CONTROLLER_HPP
#define PHASE_CONTROLLER_HPP

#include "simulation/SimulationTypes.hpp"
#include "simulation/TextTargetSampler.hpp"
#include "utils/Vector3D.hpp"
#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace GlyphFlow {

class SimulationEventSink;

/**
 * @brief Phase and convergence state of one particle group
 */
struct PhaseState {
  Phase phase{Phase::Flow};
  float convergence{0.0f};
  float targetConvergence{0.0f};
  float maxConvergence{1.0f};

  // Set on the first tick spent in text; the hold timer runs from here
  std::optional<float> lastTextTime;
  std::optional<float> holdDurationOverride;
  float releaseSpeed{1.0f};
  DissolveMode dissolveMode{DissolveMode::None};

  Vector3D sweepDirection{};
  Vector3D currentSweep{};

  // Formation (group A only)
  CharacterRecordList characters;
  FormationAnimation animation{FormationAnimation::DirectSnap};
  bool formationPending{false};
  std::optional<float> formationStartTime;

  // Back to defaults after a release: ceiling 1, default hold, speed 1, no dissolve
  void clearLyricOverrides();
};

/**
 * @brief A flow request captured while group A holds text
 *
 * An empty pattern means the generic organic pattern.
 */
struct PendingFlowCommand {
  std::optional<std::string> pattern;
  FlowOptions options;
};

/**
 * @brief Two-group phase state machine
 *
 * Group A spans [0, splitIndex) and group B [splitIndex, count). While the
 * split index equals the particle count group B is inert.
 *
 * Per group: flow -> forming -> text -> releasing -> flow. Commands move
 * groups into forming or text; advance() handles the timed transitions and
 * reports the ones the engine has to act on.
 */
class PhaseController {
public:
  static constexpr float RELEASE_THRESHOLD = 0.02f;
  static constexpr float FLOW_CONVERGENCE = 0.10f;
  static constexpr float SWEEP_EASE = 0.025f;
  static constexpr float DEFAULT_HOLD_DURATION = 2.5f;

  struct TickResult {
    bool groupAFormed{false};
    // Group A just re-entered flow; the engine applies the next flow target
    bool groupAReleased{false};
    bool groupBReleased{false};
  };

  PhaseController() = default;

  // Both groups back to flow with zero convergence, no split, nothing pending
  void reset(size_t particleCount);

  void setEventSink(SimulationEventSink *sink) { m_eventSink = sink; }

  void setHoldDuration(float seconds) { m_holdDuration = seconds; }
  float getHoldDuration() const { return m_holdDuration; }

  // Group A only; group B always uses the raw macro rates
  void setConvergenceScales(float upScale, float downScale) {
    m_convUpScale = upScale;
    m_convDnScale = downScale;
  }

  PhaseState &getState(ParticleGroup group) {
    return group == ParticleGroup::A ? m_groupA : m_groupB;
  }
  const PhaseState &getState(ParticleGroup group) const {
    return group == ParticleGroup::A ? m_groupA : m_groupB;
  }

  size_t getParticleCount() const { return m_particleCount; }
  size_t getSplitIndex() const { return m_splitIndex; }
  bool isSplit() const { return m_splitIndex < m_particleCount; }

  // splitIndex = count / 2
  void split();

  // splitIndex = count and group B back to idle flow
  void merge();

  bool isGroupBPatternActive() const { return m_groupBPatternActive; }
  void setGroupBPatternActive(bool active) { m_groupBPatternActive = active; }

  // Set the phase and publish it, also when a new text replaces a held one
  void transition(ParticleGroup group, Phase to, const std::string &detail = "");

  // Group A is forming or holding text, so flow requests must wait
  bool isHoldingText() const {
    return m_groupA.phase == Phase::Text || m_groupA.phase == Phase::Forming;
  }

  // Replaces any earlier pending request
  void deferFlow(PendingFlowCommand command) { m_pendingFlow = std::move(command); }
  bool hasPendingFlow() const { return m_pendingFlow.has_value(); }
  std::optional<PendingFlowCommand> takePendingFlow();

  /**
   * @brief One tick of convergence, sweep, formation and hold timing
   *
   * Formation reveals write into `targets` (packed xyz).
   */
  TickResult advance(float elapsedTime, const MacroParams &macro,
                     std::vector<float> &targets, std::mt19937 &rng);

private:
  void advanceConvergence(PhaseState &state, float upRate, float downRate);
  static void advanceSweep(PhaseState &state);
  bool holdExpired(const PhaseState &state, float elapsedTime) const;

  PhaseState m_groupA{};
  PhaseState m_groupB{};
  size_t m_particleCount{0};
  size_t m_splitIndex{0};
  bool m_groupBPatternActive{false};
  std::optional<PendingFlowCommand> m_pendingFlow;

  float m_holdDuration{DEFAULT_HOLD_DURATION};
  float m_convUpScale{1.0f};
  float m_convDnScale{1.0f};

  SimulationEventSink *m_eventSink{nullptr};
};

} // namespace GlyphFlow

#endif // PHASE_CONTROLLER_HPP
