/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_CONTEXT_HPP
#define SIMULATION_CONTEXT_HPP

#include "simulation/SimulationTypes.hpp"
#include "utils/Vector3D.hpp"
#include <array>
#include <cstddef>

namespace GlyphFlow {

// Per-group values the kernel reads for each particle
struct GroupUniforms {
  float convergence{0.0f};
  Vector3D sweep{};
};

struct LayerUniforms {
  PatternId patternId{NO_PATTERN};
  Vector3D origin{};
  float scale{1.0f};
};

/**
 * @brief Everything the force kernel reads for one tick
 *
 * Built by the engine after the macro curve and phase controller have
 * advanced, then passed by const reference to every kernel batch. Nothing
 * here changes while the kernel runs.
 */
struct SimulationContext {
  float deltaTime{0.016f};
  float time{0.0f};
  float wavePhase{0.0f};

  // Macro state after dissolve boosts
  float noiseStrength{0.0f};
  float noiseScale{0.1f};
  float springStrength{0.0f};
  float damping{0.99f};
  float vortexStrength{0.0f};
  float waveStrength{0.0f};
  float gravity{0.0f};

  // Camera in the particle frame (inverse of the world rotation applied)
  Vector3D cameraPosition{0.0f, 0.0f, 5.0f};
  bool isOrthographic{false};

  // 1 pins z to target z (flat text), 0 leaves z free
  float flattenZ{0.0f};

  size_t particleCount{0};
  size_t splitIndex{0};
  GroupUniforms groupA{};
  GroupUniforms groupB{};

  // Single-layer flow
  PatternId patternId{NO_PATTERN};
  Vector3D flowOrigin{};
  float flowScale{1.0f};

  // Multi-layer flow, active when layerCount > 1
  size_t layerCount{1};
  std::array<LayerUniforms, MAX_FLOW_LAYERS> layers{};

  // Text + background split inside each character slice
  PatternId backgroundPatternId{NO_PATTERN};
  float textRatio{1.0f};
  float textPerChar{1.0f};

  // Independent pattern on group B
  PatternId patternIdB{NO_PATTERN};
  Vector3D flowOriginB{};
  float flowScaleB{1.0f};
};

} // namespace GlyphFlow

#endif // SIMULATION_CONTEXT_HPP
