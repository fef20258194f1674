/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef KERNEL_HASH_HPP
#define KERNEL_HASH_HPP

#include <bit>
#include <cstdint>

namespace GlyphFlow::KernelHash {

// PCG-style integer permutation
inline uint32_t pcg(uint32_t v) {
    uint32_t state = v * 747796405u + 2891336453u;
    uint32_t word = ((state >> ((state >> 28u) + 4u)) ^ state) * 277803737u;
    return (word >> 22u) ^ word;
}

inline float toUnit(uint32_t v) {
    // Top 24 bits fit the float mantissa exactly, keeping the result below 1
    return static_cast<float>(v >> 8u) * (1.0f / 16777216.0f);
}

/**
 * @brief Stateless hash of one float to [0, 1)
 *
 * Hashes the bit pattern, so the result depends only on the argument.
 */
inline float hash1(float a) {
    return toUnit(pcg(std::bit_cast<uint32_t>(a)));
}

// Stateless hash of (a, b) to [0, 1)
inline float hash2(float a, float b) {
    return toUnit(pcg(std::bit_cast<uint32_t>(a) ^ pcg(std::bit_cast<uint32_t>(b))));
}

} // namespace GlyphFlow::KernelHash

#endif // KERNEL_HASH_HPP
