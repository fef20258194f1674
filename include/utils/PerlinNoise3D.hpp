/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PERLIN_NOISE_3D_HPP
#define PERLIN_NOISE_3D_HPP

#include "utils/Vector3D.hpp"
#include <vector>

namespace GlyphFlow {

/**
 * @brief Improved Perlin noise over 3D space
 *
 * The permutation table is built once from the seed and never mutated, so
 * concurrent noise() calls from kernel batches are safe.
 */
class PerlinNoise3D {
public:
    explicit PerlinNoise3D(unsigned int seed = 0);

    // Scalar noise, roughly in [-1, 1]
    float noise(float x, float y, float z) const;

    // Three decorrelated channels sampled at offset copies of p
    Vector3D noiseVec3(const Vector3D& p) const;

private:
    static float fade(float t);
    static float lerp(float t, float a, float b);
    static float grad(int hash, float x, float y, float z);

    std::vector<int> m_permutation;
};

} // namespace GlyphFlow

#endif // PERLIN_NOISE_3D_HPP
