/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/SeededRandom.hpp"

namespace Skybound {

SeededRandom::SeededRandom(uint64_t seed, uint32_t stream) {
    std::seed_seq seq{static_cast<uint32_t>(seed & 0xFFFFFFFFu),
                      static_cast<uint32_t>(seed >> 32), stream};
    m_engine.seed(seq);
}

float SeededRandom::nextFloat01() {
    // 24 random bits fill the float mantissa exactly
    return static_cast<float>(nextU32() >> 8) * (1.0f / 16777216.0f);
}

float SeededRandom::nextFloat(float min, float max) {
    if (!(max > min)) {
        return min;
    }
    return min + (max - min) * nextFloat01();
}

int SeededRandom::nextInt(int min, int max) {
    if (max <= min) {
        return min;
    }
    const uint64_t span = static_cast<uint64_t>(static_cast<int64_t>(max) - min) + 1u;
    return static_cast<int>(min + static_cast<int64_t>(nextU32() % span));
}

bool SeededRandom::chance(float probability) {
    if (probability <= 0.0f) {
        return false;
    }
    if (probability >= 1.0f) {
        return true;
    }
    return nextFloat01() < probability;
}

size_t SeededRandom::weightedIndex(std::span<const float> weights) {
    float total = 0.0f;
    for (float w : weights) {
        total += w > 0.0f ? w : 0.0f;
    }
    if (total <= 0.0f) {
        return 0;
    }

    float pick = nextFloat01() * total;
    for (size_t i = 0; i < weights.size(); ++i) {
        const float w = weights[i] > 0.0f ? weights[i] : 0.0f;
        if (pick < w) {
            return i;
        }
        pick -= w;
    }
    // Rounding can leave pick just above the last bucket
    for (size_t i = weights.size(); i > 0; --i) {
        if (weights[i - 1] > 0.0f) {
            return i - 1;
        }
    }
    return 0;
}

} // namespace Skybound
