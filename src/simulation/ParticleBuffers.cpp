/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/ParticleBuffers.hpp"
#include <cmath>
#include <numbers>

namespace GlyphFlow {

void ParticleBuffers::allocate(size_t particleCount, std::mt19937 &rng) {
  positions.assign(particleCount * 3, 0.0f);
  velocities.assign(particleCount * 3, 0.0f);
  targets.assign(particleCount * 3, 0.0f);
  life.assign(particleCount * 2, 0.0f);
  colors.assign(particleCount * 3, 0.0f);

  std::uniform_real_distribution<float> uniform(0.0f, 1.0f);

  for (size_t i = 0; i < particleCount; ++i) {
    const float theta = uniform(rng) * 2.0f * std::numbers::pi_v<float>;
    const float phi = std::acos(2.0f * uniform(rng) - 1.0f);
    const float r = std::cbrt(uniform(rng)) * 3.0f;
    positions[i * 3] = r * std::sin(phi) * std::cos(theta);
    positions[i * 3 + 1] = r * std::sin(phi) * std::sin(theta);
    positions[i * 3 + 2] = r * std::cos(phi);

    colors[i * 3 + (i % 3)] = 1.0f;

    life[i * 2] = uniform(rng) * 10.0f;
    life[i * 2 + 1] = 5.0f + uniform(rng) * 10.0f;
  }
}

void ParticleBuffers::clear() {
  positions.clear();
  velocities.clear();
  targets.clear();
  life.clear();
  colors.clear();
  positions.shrink_to_fit();
  velocities.shrink_to_fit();
  targets.shrink_to_fit();
  life.shrink_to_fit();
  colors.shrink_to_fit();
}

bool ParticleBuffers::isConsistent() const {
  const size_t n = count();
  return positions.size() == n * 3 && velocities.size() == n * 3 &&
         targets.size() == n * 3 && life.size() == n * 2 &&
         colors.size() == n * 3;
}

} // namespace GlyphFlow
