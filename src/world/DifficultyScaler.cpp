/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/DifficultyScaler.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace Skybound {

DifficultyScaler::DifficultyScaler(std::vector<DifficultyTier> tiers, int extraPlatformEvery,
                                   int maxExtraPlatforms)
    : m_tiers(normalize(std::move(tiers))),
      m_extraPlatformEvery(std::max(1, extraPlatformEvery)),
      m_maxExtraPlatforms(std::max(0, maxExtraPlatforms)) {}

std::vector<DifficultyTier> DifficultyScaler::normalize(std::vector<DifficultyTier> tiers) {
    if (tiers.empty()) {
        throw std::invalid_argument("DifficultyScaler requires at least one tier");
    }

    std::stable_sort(tiers.begin(), tiers.end(),
                     [](const DifficultyTier& a, const DifficultyTier& b) {
                         return a.startLevel < b.startLevel;
                     });

    for (auto& tier : tiers) {
        if (tier.gapMin > tier.gapMax) {
            DIFFICULTY_WARN(std::format("Tier '{}' has gapMin > gapMax, swapping", tier.name));
            std::swap(tier.gapMin, tier.gapMax);
        }
        if (tier.platformWidthMin > tier.platformWidthMax) {
            std::swap(tier.platformWidthMin, tier.platformWidthMax);
        }
        tier.gapMin = std::max(0.0f, tier.gapMin);
        tier.maxRise = std::max(0.0f, tier.maxRise);
        tier.enemyDensity = std::clamp(tier.enemyDensity, 0.0f, 1.0f);
        tier.powerUpDensity = std::clamp(tier.powerUpDensity, 0.0f, 1.0f);
        tier.maxEnemies = std::max(0, tier.maxEnemies);
        tier.basePlatformCount = std::max(2, tier.basePlatformCount);
    }

    // Difficulty never drops when moving to a later tier
    for (size_t i = 1; i < tiers.size(); ++i) {
        const DifficultyTier& prev = tiers[i - 1];
        DifficultyTier& cur = tiers[i];
        const bool repaired = cur.gapMin < prev.gapMin || cur.gapMax < prev.gapMax ||
                              cur.maxRise < prev.maxRise || cur.enemyDensity < prev.enemyDensity ||
                              cur.maxEnemies < prev.maxEnemies;
        cur.gapMin = std::max(cur.gapMin, prev.gapMin);
        cur.gapMax = std::max(cur.gapMax, prev.gapMax);
        cur.maxRise = std::max(cur.maxRise, prev.maxRise);
        cur.enemyDensity = std::max(cur.enemyDensity, prev.enemyDensity);
        cur.maxEnemies = std::max(cur.maxEnemies, prev.maxEnemies);
        if (repaired) {
            DIFFICULTY_WARN(std::format("Tier '{}' was easier than '{}', raised to match",
                                        cur.name, prev.name));
        }
    }

    return tiers;
}

const DifficultyTier& DifficultyScaler::tierFor(int levelIndex) const {
    const DifficultyTier* selected = &m_tiers.front();
    for (const auto& tier : m_tiers) {
        if (tier.startLevel <= levelIndex) {
            selected = &tier;
        } else {
            break;
        }
    }
    return *selected;
}

DifficultyParams DifficultyScaler::paramsFor(int levelIndex) const {
    const DifficultyTier& tier = tierFor(levelIndex);

    DifficultyParams params;
    params.tierName = tier.name;
    params.levelIndex = levelIndex;
    params.gapMin = tier.gapMin;
    params.gapMax = tier.gapMax;
    params.maxRise = tier.maxRise;
    params.enemyDensity = tier.enemyDensity;
    params.powerUpDensity = tier.powerUpDensity;
    params.platformWidthMin = tier.platformWidthMin;
    params.platformWidthMax = tier.platformWidthMax;
    params.maxEnemies = tier.maxEnemies;

    const int extra = std::min(std::max(levelIndex, 0) / m_extraPlatformEvery, m_maxExtraPlatforms);
    params.platformCount = tier.basePlatformCount + extra;
    return params;
}

} // namespace Skybound
