/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FORCE_KERNEL_HPP
#define FORCE_KERNEL_HPP

#include "simulation/ParticleBuffers.hpp"
#include "simulation/SimulationContext.hpp"
#include "utils/PerlinNoise3D.hpp"
#include "utils/Vector3D.hpp"
#include <cstddef>

namespace GlyphFlow {

/**
 * @brief Per-particle force integration
 *
 * updateRange() applies one tick to particles [begin, end). Particles never
 * read each other's state and all randomness is a hash of (index, time), so
 * disjoint ranges may run on different threads in any order and give the
 * same result as a single pass.
 *
 * Per particle, in order: pattern target, attraction, curl noise, vortex,
 * wave ripple, direct pull + linger, near-target velocity suppression,
 * camera repulsion, soft boundary, gravity, velocity clamp, damping and
 * integration, z flattening, life and respawn.
 */
class ForceKernel {
public:
  static constexpr float MAX_VELOCITY = 0.08f;
  static constexpr float DIRECT_PULL = 0.08f;
  static constexpr float BACKGROUND_ATTRACTION = 0.15f;
  static constexpr float BOUNDARY_RADIUS = 6.0f;
  static constexpr float BOUNDARY_STRENGTH = 0.006f;
  static constexpr float RESPAWN_SHELL_MIN = 2.5f;
  static constexpr float RESPAWN_SHELL_MAX = 4.5f;

  // Pattern assignment for one particle after precedence is applied
  struct ResolvedPattern {
    PatternId id{NO_PATTERN};
    Vector3D origin{};
    float scale{1.0f};
    bool background{false};
  };

  explicit ForceKernel(unsigned int noiseSeed = 0);

  /**
   * @brief Pick the pattern driving particle `index`
   *
   * Multi-layer flow wins, then the background share of a character slice,
   * then group B's own pattern, then the single global pattern.
   */
  static ResolvedPattern resolvePattern(const SimulationContext &ctx, size_t index);

  // Stable per-particle value in [0, 1)
  static float particleHash(size_t index);

  // clamp(convergence - sweepDelay * 0.03 - hash * 0.01, 0, 1)
  static float effectiveAttraction(float convergence, float sweepDelay, float hash);

  /**
   * @brief Where an expired particle reappears
   *
   * A point on a shell of radius 2.5..4.5 around `target`, pulled toward the
   * target by attraction^2 * 0.8 + attraction * 0.2.
   */
  static Vector3D respawnPosition(size_t index, float time, const Vector3D &target,
                                  float attraction);

  void updateRange(ParticleBuffers &buffers, const SimulationContext &ctx, size_t begin,
                   size_t end) const;

private:
  PerlinNoise3D m_noise;
};

} // namespace GlyphFlow

#endif // FORCE_KERNEL_HPP
