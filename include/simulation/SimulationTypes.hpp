/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_TYPES_HPP
#define SIMULATION_TYPES_HPP

#include "utils/Vector3D.hpp"
#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace GlyphFlow {

// Procedural pattern id; 0 means "no procedural pattern, use the target buffer"
using PatternId = int;
constexpr PatternId NO_PATTERN = 0;

constexpr size_t MAX_FLOW_LAYERS = 4;

enum class Phase : uint8_t {
  Flow = 0,
  Forming = 1,
  Text = 2,
  Releasing = 3
};

inline const char *toString(Phase phase) {
  switch (phase) {
  case Phase::Flow:
    return "flow";
  case Phase::Forming:
    return "forming";
  case Phase::Text:
    return "text";
  case Phase::Releasing:
    return "releasing";
  }
  return "unknown";
}

// For Boost.Test diagnostics
inline std::ostream &operator<<(std::ostream &os, Phase phase) {
  return os << toString(phase);
}

enum class ParticleGroup : uint8_t { A = 0, B = 1 };

inline const char *toString(ParticleGroup group) {
  return group == ParticleGroup::A ? "A" : "B";
}

inline std::ostream &operator<<(std::ostream &os, ParticleGroup group) {
  return os << toString(group);
}

enum class TextAlign : uint8_t { Center, Left };

enum class DissolveMode : uint8_t { None, Down };

/**
 * @brief Modes accepted by ParticleEngine::setMode
 *
 * Free covers every mode that is neither text nor flow: particles drift with
 * zero convergence.
 */
enum class SimulationMode : uint8_t { Text, Forming, Flow, Free };

inline const char *toString(SimulationMode mode) {
  switch (mode) {
  case SimulationMode::Text:
    return "text";
  case SimulationMode::Forming:
    return "forming";
  case SimulationMode::Flow:
    return "flow";
  case SimulationMode::Free:
    return "free";
  }
  return "unknown";
}

enum class FormationAnimation : uint8_t {
  WaveReveal = 0,
  RainDrop,
  SpiralPerChar,
  RingToChar,
  Typewriter,
  ColumnDrop,
  CenterBurst,
  DirectSnap,
  SphereContract,
  RiseUp,
  ScatterIn,
  GridDissolve,
  Tornado,
  Phyllotaxis,
  ShockwaveRing,
  FlatPlane,
  COUNT
};

constexpr size_t FORMATION_ANIMATION_COUNT =
    static_cast<size_t>(FormationAnimation::COUNT);

/**
 * @brief The ten eased scalars of the macro tension curve
 */
struct MacroParams {
  float noiseStrength{0.0f};
  float noiseScale{0.0f};
  float springStrength{0.0f};
  float damping{0.0f};
  float vortexStrength{0.0f};
  float waveStrength{0.0f};
  float gravity{0.0f};
  float convergenceUpRate{0.0f};
  float convergenceDownRate{0.0f};
  float pointScale{0.0f};
};

// One macro curve row: active while authored time < endTime
struct MacroPhaseRow {
  float endTime{0.0f};
  MacroParams params{};
};

/**
 * @brief Per-command physics overrides
 *
 * Each present field replaces the macro curve target for that scalar until
 * the next command clears it. lerpRate replaces the ambient ease rate while
 * any override is present.
 */
struct PhysicsOverrides {
  std::optional<float> spring;
  std::optional<float> damping;
  std::optional<float> noiseStrength;
  std::optional<float> noiseScale;
  std::optional<float> vortex;
  std::optional<float> wave;
  std::optional<float> gravity;
  std::optional<float> pointScale;
  std::optional<float> convUp;
  std::optional<float> convDn;
  std::optional<float> lerpRate;

  bool any() const {
    return spring || damping || noiseStrength || noiseScale || vortex || wave ||
           gravity || pointScale || convUp || convDn || lerpRate;
  }
};

/**
 * @brief Options for setText / setShadowSculptureTarget
 */
struct TextOptions {
  std::optional<FormationAnimation> animation;
  std::optional<Vector3D> viewDirection;
  std::optional<float> maxConvergence;
  std::optional<float> holdDuration;
  std::optional<float> releaseSpeed;
  DissolveMode dissolveMode{DissolveMode::None};
  Vector3D origin{};
  std::optional<float> targetWidth;
  TextAlign align{TextAlign::Center};
  ParticleGroup particleGroup{ParticleGroup::A};

  // Dual text + pattern split inside each character slice
  std::optional<std::string> backgroundPattern;
  std::optional<float> textRatio;

  // Independent procedural pattern on group B beneath a group-A text
  std::optional<std::string> groupBPattern;
  std::optional<float> groupBConvergence;
  Vector3D groupBOrigin{};
  std::optional<float> groupBScale;

  PhysicsOverrides physics;
};

struct FlowOptions {
  PhysicsOverrides physics;
};

struct FlowLayer {
  std::string pattern;
  Vector3D origin{};
  float scale{1.0f};
};

using FlowLayerList = boost::container::small_vector<FlowLayer, MAX_FLOW_LAYERS>;

/**
 * @brief Inputs consumed from collaborators once per frame
 */
struct TickContext {
  float deltaTime{0.0f};
  float elapsedTime{0.0f};
  float musicTime{0.0f}; // authored playback clock; 0 falls back to elapsedTime
  Vector3D cameraPosition{0.0f, 0.0f, 5.0f};
  bool isOrthographic{false};
};

struct EngineStats {
  size_t particleCount{0};
  size_t splitIndex{0};
  Phase phaseA{Phase::Flow};
  Phase phaseB{Phase::Flow};
  float convergenceA{0.0f};
  float convergenceB{0.0f};
  double lastUpdateTimeMs{0.0};
  bool lastUpdateThreaded{false};
  size_t lastBatchCount{0};
};

} // namespace GlyphFlow

#endif // SIMULATION_TYPES_HPP
