/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameConfig.hpp"

namespace Skybound {

std::vector<DifficultyTier> defaultDifficultyTiers() {
    //       name      start gapMin gapMax rise  enemy powerUp wMin  wMax  maxE base
    return {
        {"Meadow",  2,   40.0f,  90.0f, 40.0f, 0.15f, 0.30f, 90.0f, 140.0f, 1, 5},
        {"Hills",   4,   60.0f, 120.0f, 55.0f, 0.25f, 0.25f, 80.0f, 120.0f, 2, 6},
        {"Cliffs",  7,   80.0f, 140.0f, 65.0f, 0.35f, 0.22f, 70.0f, 110.0f, 3, 7},
        {"Peaks",  10,  100.0f, 155.0f, 72.0f, 0.45f, 0.20f, 60.0f, 100.0f, 3, 8},
    };
}

GameConfig GameConfig::defaults() {
    GameConfig config;
    config.generation.tiers = defaultDifficultyTiers();
    return config;
}

} // namespace Skybound
