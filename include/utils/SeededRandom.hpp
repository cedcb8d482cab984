/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SEEDED_RANDOM_HPP
#define SEEDED_RANDOM_HPP

#include <cstdint>
#include <random>
#include <span>

namespace Skybound {

/**
 * Reproducible random stream for level generation.
 *
 * std::mt19937 output is fully specified by the standard, but the
 * distribution classes are not, so ranges are mapped from the raw 32-bit
 * output here. The same (seed, stream) pair yields the same sequence on
 * every platform and standard library.
 */
class SeededRandom {
public:
    SeededRandom(uint64_t seed, uint32_t stream);

    // [0, 1)
    float nextFloat01();
    // [min, max]; returns min when max <= min
    float nextFloat(float min, float max);
    // [min, max] inclusive; returns min when max <= min
    int nextInt(int min, int max);
    bool chance(float probability);
    // Index drawn proportionally to the weights; 0 when all weights are zero
    size_t weightedIndex(std::span<const float> weights);
    uint32_t nextU32() { return static_cast<uint32_t>(m_engine()); }

private:
    std::mt19937 m_engine;
};

/**
 * Tiny xorshift stream stored inside an entity's behavior state, so enemy
 * AI stays deterministic without sharing the generator's stream.
 */
inline uint32_t xorshift32(uint32_t& state) {
    if (state == 0) {
        state = 0x9E3779B9u;
    }
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    return state;
}

} // namespace Skybound

#endif // SEEDED_RANDOM_HPP
