/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/PerlinNoise3D.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace GlyphFlow {

PerlinNoise3D::PerlinNoise3D(unsigned int seed) {
    m_permutation.resize(256);
    std::iota(m_permutation.begin(), m_permutation.end(), 0);

    std::default_random_engine engine(seed);
    std::shuffle(m_permutation.begin(), m_permutation.end(), engine);

    // Doubled so corner lookups never wrap
    auto copy = m_permutation;
    m_permutation.insert(m_permutation.end(), copy.begin(), copy.end());
}

float PerlinNoise3D::fade(float t) {
    return t * t * t * (t * (t * 6 - 15) + 10);
}

float PerlinNoise3D::lerp(float t, float a, float b) {
    return a + t * (b - a);
}

float PerlinNoise3D::grad(int hash, float x, float y, float z) {
    int h = hash & 15;
    float u = h < 8 ? x : y;
    float v = h < 4 ? y : (h == 12 || h == 14) ? x : z;
    return ((h & 1) == 0 ? u : -u) + ((h & 2) == 0 ? v : -v);
}

float PerlinNoise3D::noise(float x, float y, float z) const {
    const float fx = std::floor(x);
    const float fy = std::floor(y);
    const float fz = std::floor(z);

    const int X = static_cast<int>(fx) & 255;
    const int Y = static_cast<int>(fy) & 255;
    const int Z = static_cast<int>(fz) & 255;

    x -= fx;
    y -= fy;
    z -= fz;

    const float u = fade(x);
    const float v = fade(y);
    const float w = fade(z);

    const auto& p = m_permutation;
    const int A = p[X] + Y;
    const int AA = p[A] + Z;
    const int AB = p[A + 1] + Z;
    const int B = p[X + 1] + Y;
    const int BA = p[B] + Z;
    const int BB = p[B + 1] + Z;

    return lerp(w,
                lerp(v, lerp(u, grad(p[AA], x, y, z), grad(p[BA], x - 1, y, z)),
                     lerp(u, grad(p[AB], x, y - 1, z), grad(p[BB], x - 1, y - 1, z))),
                lerp(v, lerp(u, grad(p[AA + 1], x, y, z - 1), grad(p[BA + 1], x - 1, y, z - 1)),
                     lerp(u, grad(p[AB + 1], x, y - 1, z - 1),
                          grad(p[BB + 1], x - 1, y - 1, z - 1))));
}

Vector3D PerlinNoise3D::noiseVec3(const Vector3D& p) const {
    const float x = p.getX();
    const float y = p.getY();
    const float z = p.getZ();
    return Vector3D(noise(x, y, z),
                    noise(x + 31.416f, y + 17.123f, z - 9.271f),
                    noise(x - 19.734f, y + 43.207f, z + 11.913f));
}

} // namespace GlyphFlow
