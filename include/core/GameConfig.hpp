/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_CONFIG_HPP
#define GAME_CONFIG_HPP

#include <string>
#include <vector>

namespace Skybound {

/**
 * Movement tunables. Speeds are in pixels per tick and accelerations in
 * pixels per tick squared, where one tick is one fixed update step.
 */
struct PhysicsConfig {
    float gravity{0.8f};
    float runAcceleration{0.5f};
    float friction{0.12f};            // fraction of vx lost per tick without input
    float maxHorizontalSpeed{6.0f};
    float maxVerticalSpeed{15.0f};
    float jumpSpeed{12.0f};
    float boostedJumpSpeed{16.0f};
    float doubleJumpMinVelocityY{-8.0f}; // mid-air jump only while vy is above this
    float maxJumpHeight{84.0f};       // designer cap, combined with the derived envelope
    float maxJumpDistance{180.0f};
};

/**
 * Generation parameters for one named band of levels. The tier applies from
 * startLevel until the next tier's startLevel.
 */
struct DifficultyTier {
    std::string name;
    int startLevel{2};
    float gapMin{40.0f};
    float gapMax{90.0f};
    float maxRise{40.0f};
    float enemyDensity{0.15f};
    float powerUpDensity{0.30f};
    float platformWidthMin{90.0f};
    float platformWidthMax{140.0f};
    int maxEnemies{1};
    int basePlatformCount{5};
};

struct GenerationConfig {
    std::vector<DifficultyTier> tiers;
    float worldHeight{600.0f};
    float topMargin{120.0f};          // highest allowed platform top
    float groundY{560.0f};            // lowest allowed platform top
    float platformHeight{20.0f};
    float startPlatformWidth{240.0f};
    float reachFraction{0.85f};       // share of the jump envelope the generator may use
    float landingMargin{8.0f};
    float powerUpHover{25.0f};
    float worldEndPadding{80.0f};
    int extraPlatformEvery{3};
    int maxExtraPlatforms{4};
};

struct SessionConfig {
    int startHealth{3};
    int maxHealth{5};
    int invincibilityTicks{120};
    float knockbackX{8.0f};
    float knockbackY{3.0f};
    int speedBoostTicks{300};
    float speedBoostMultiplier{1.5f};
    int jumpBoostTicks{300};
    int shieldTicks{1800};
    int doubleJumpTicks{240};
    float fixedTimestep{1.0f / 60.0f};
    float targetFPS{60.0f};
};

struct GameConfig {
    PhysicsConfig physics;
    GenerationConfig generation;
    SessionConfig session;

    static GameConfig defaults();
};

std::vector<DifficultyTier> defaultDifficultyTiers();

} // namespace Skybound

#endif // GAME_CONFIG_HPP
