/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DIFFICULTY_SCALER_HPP
#define DIFFICULTY_SCALER_HPP

#include "core/GameConfig.hpp"
#include <string>
#include <vector>

namespace Skybound {

// Generator parameters for one concrete level index
struct DifficultyParams {
    std::string tierName;
    int levelIndex{2};
    float gapMin{0.0f};
    float gapMax{0.0f};
    float maxRise{0.0f};
    float enemyDensity{0.0f};
    float powerUpDensity{0.0f};
    float platformWidthMin{0.0f};
    float platformWidthMax{0.0f};
    int maxEnemies{0};
    int platformCount{0};
};

/**
 * Maps a level index to generation parameters.
 *
 * Tiers are sorted by start level and repaired so gaps, rise, enemy density
 * and enemy count never decrease from one tier to the next. Indices past the
 * last tier keep its parameters; indices before the first tier use the first.
 * Only the platform count keeps growing, by one every extraPlatformEvery
 * levels up to maxExtraPlatforms.
 */
class DifficultyScaler {
public:
    /**
     * @throws std::invalid_argument if tiers is empty
     */
    DifficultyScaler(std::vector<DifficultyTier> tiers, int extraPlatformEvery = 3,
                     int maxExtraPlatforms = 4);

    explicit DifficultyScaler(const GenerationConfig& config)
        : DifficultyScaler(config.tiers, config.extraPlatformEvery, config.maxExtraPlatforms) {}

    DifficultyParams paramsFor(int levelIndex) const;

    const std::vector<DifficultyTier>& getTiers() const { return m_tiers; }

    // Sorted, sanitised, running-max copy of the input; logs what it had to fix
    static std::vector<DifficultyTier> normalize(std::vector<DifficultyTier> tiers);

private:
    std::vector<DifficultyTier> m_tiers;
    int m_extraPlatformEvery;
    int m_maxExtraPlatforms;

    const DifficultyTier& tierFor(int levelIndex) const;
};

} // namespace Skybound

#endif // DIFFICULTY_SCALER_HPP
