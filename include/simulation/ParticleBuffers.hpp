/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_BUFFERS_HPP
#define PARTICLE_BUFFERS_HPP

#include "utils/Vector3D.hpp"
#include <cstddef>
#include <random>
#include <vector>

namespace GlyphFlow {

/**
 * @brief Structure-of-arrays particle storage
 *
 * Vector attributes are packed xyz (index * 3), life is packed
 * (remaining, total) (index * 2). Sizes never change after allocate(); group
 * splits reassign index ranges instead of moving particles.
 */
struct ParticleBuffers {
  std::vector<float> positions;
  std::vector<float> velocities;
  std::vector<float> targets;
  std::vector<float> life;
  std::vector<float> colors;

  size_t count() const { return positions.size() / 3; }

  /**
   * @brief Size every buffer for `count` particles and seed initial state
   *
   * Positions fill a radius-3 ball, velocities are zero, targets are left at
   * the origin for the caller to fill, colors cycle red/green/blue by index,
   * life is (U*10, 5 + U*10).
   */
  void allocate(size_t particleCount, std::mt19937 &rng);

  void clear();

  // Sizes agree with count()
  bool isConsistent() const;

  Vector3D getPosition(size_t i) const {
    return Vector3D(positions[i * 3], positions[i * 3 + 1], positions[i * 3 + 2]);
  }

  Vector3D getVelocity(size_t i) const {
    return Vector3D(velocities[i * 3], velocities[i * 3 + 1], velocities[i * 3 + 2]);
  }

  Vector3D getTarget(size_t i) const {
    return Vector3D(targets[i * 3], targets[i * 3 + 1], targets[i * 3 + 2]);
  }

  Vector3D getColor(size_t i) const {
    return Vector3D(colors[i * 3], colors[i * 3 + 1], colors[i * 3 + 2]);
  }

  void setPosition(size_t i, const Vector3D &v) {
    positions[i * 3] = v.getX();
    positions[i * 3 + 1] = v.getY();
    positions[i * 3 + 2] = v.getZ();
  }

  void setVelocity(size_t i, const Vector3D &v) {
    velocities[i * 3] = v.getX();
    velocities[i * 3 + 1] = v.getY();
    velocities[i * 3 + 2] = v.getZ();
  }

  void setTarget(size_t i, const Vector3D &v) {
    targets[i * 3] = v.getX();
    targets[i * 3 + 1] = v.getY();
    targets[i * 3 + 2] = v.getZ();
  }
};

} // namespace GlyphFlow

#endif // PARTICLE_BUFFERS_HPP
