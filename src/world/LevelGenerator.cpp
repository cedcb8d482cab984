/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/LevelGenerator.hpp"
#include "core/Logger.hpp"
#include "utils/SeededRandom.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace Skybound {

namespace {

// Checked before anything derived from the config is built
JumpEnvelope validatedEnvelope(const GenerationConfig& generation, const PhysicsConfig& physics) {
    LevelGenerator::validate(generation, physics);
    return JumpEnvelope::effective(physics);
}

struct PlatformSpec {
    float x;
    float y;
    float width;
    float height;
};

// Hand-authored first level, identical for every seed
constexpr PlatformSpec TUTORIAL_PLATFORMS[] = {
    {0.0f, 560.0f, 320.0f, 40.0f},
    {380.0f, 500.0f, 120.0f, 20.0f},
    {560.0f, 450.0f, 120.0f, 20.0f},
    {740.0f, 410.0f, 120.0f, 20.0f},
    {920.0f, 460.0f, 140.0f, 20.0f},
    {1100.0f, 420.0f, 100.0f, 20.0f},
};
constexpr float TUTORIAL_WIDTH = 1200.0f;
constexpr float TUTORIAL_HEIGHT = 600.0f;
constexpr size_t TUTORIAL_COIN_PLATFORM = 2;
constexpr size_t TUTORIAL_ENEMY_PLATFORM = 4;

constexpr float START_OFFSET_X = 30.0f;
constexpr float ENEMY_JITTER = 30.0f;
constexpr float GOLD_COIN_CHANCE = 0.05f;
constexpr float SILVER_COIN_CHANCE = 0.20f;

Vector2D goalOnPlatform(const AABB& platform) {
    return Vector2D(platform.center.getX() - GOAL_WIDTH * 0.5f, platform.top() - GOAL_HEIGHT);
}

} // namespace

LevelGenerator::LevelGenerator(const GenerationConfig& generation, const PhysicsConfig& physics,
                               SpawnTable spawnTable)
    : m_generation(generation),
      m_physics(physics),
      m_spawnTable(std::move(spawnTable)),
      m_envelope(validatedEnvelope(generation, physics)),
      m_scaler(generation) {
    LEVELGEN_INFO(std::format("Level generator ready: reach {:.1f}px across, {:.1f}px up, {} tiers",
                              reachDistance(), reachHeight(), m_scaler.getTiers().size()));
}

void LevelGenerator::validate(const GenerationConfig& generation, const PhysicsConfig& physics) {
    if (!(physics.maxJumpDistance > 0.0f)) {
        throw GenerationConfigError(
            std::format("maxJumpDistance must be positive, got {}", physics.maxJumpDistance));
    }
    if (!(physics.maxJumpHeight > 0.0f)) {
        throw GenerationConfigError(
            std::format("maxJumpHeight must be positive, got {}", physics.maxJumpHeight));
    }
    if (!(physics.gravity > 0.0f)) {
        throw GenerationConfigError(std::format("gravity must be positive, got {}", physics.gravity));
    }
    if (!(physics.jumpSpeed > 0.0f)) {
        throw GenerationConfigError(std::format("jumpSpeed must be positive, got {}", physics.jumpSpeed));
    }
    if (!(physics.maxHorizontalSpeed > 0.0f) || !(physics.maxVerticalSpeed > 0.0f)) {
        throw GenerationConfigError(
            std::format("terminal speeds must be positive, got horizontal {} vertical {}",
                        physics.maxHorizontalSpeed, physics.maxVerticalSpeed));
    }
    if (generation.tiers.empty()) {
        throw GenerationConfigError("at least one difficulty tier is required");
    }
    if (!(generation.reachFraction > 0.0f) || generation.reachFraction > 1.0f) {
        throw GenerationConfigError(
            std::format("reachFraction must be in (0, 1], got {}", generation.reachFraction));
    }
    if (!(generation.platformHeight > 0.0f)) {
        throw GenerationConfigError(
            std::format("platformHeight must be positive, got {}", generation.platformHeight));
    }
    if (generation.topMargin > generation.groundY ||
        generation.groundY + generation.platformHeight > generation.worldHeight) {
        throw GenerationConfigError(
            std::format("vertical layout does not fit: topMargin {}, groundY {}, worldHeight {}",
                        generation.topMargin, generation.groundY, generation.worldHeight));
    }
}

float LevelGenerator::reachDistance() const {
    return m_envelope.maxDistance() * m_generation.reachFraction;
}

float LevelGenerator::reachHeight() const {
    return m_envelope.maxHeight() * m_generation.reachFraction;
}

Level LevelGenerator::generate(int levelIndex, uint64_t seed) const {
    if (levelIndex < 1) {
        LEVELGEN_WARN(std::format("Level index {} out of range, using 1", levelIndex));
        levelIndex = 1;
    }
    return generate(levelIndex, seed, m_scaler.paramsFor(levelIndex));
}

Level LevelGenerator::generate(int levelIndex, uint64_t seed, const DifficultyParams& params) const {
    if (levelIndex <= 1) {
        return buildTutorial(seed);
    }

    SeededRandom rng(seed, static_cast<uint32_t>(levelIndex));
    EntityID nextId = FIRST_LEVEL_ENTITY_ID;

    Level level;
    level.index = levelIndex;
    level.seed = seed;
    level.tierName = params.tierName;

    const float maxGap = reachDistance();
    const float gapHi = std::clamp(params.gapMax, 0.0f, maxGap);
    const float gapLo = std::clamp(params.gapMin, 0.0f, gapHi);
    const float dropLimit = std::min(params.maxRise, reachHeight());
    const int platformCount = std::max(2, params.platformCount);

    // Start platform: wide, on the ground, never carries enemies
    level.platforms.push_back(Entity::makePlatform(nextId++, 0.0f, m_generation.groundY,
                                                   m_generation.startPlatformWidth,
                                                   m_generation.platformHeight));

    float prevRight = m_generation.startPlatformWidth;
    float prevTop = m_generation.groundY;

    for (int i = 1; i < platformCount; ++i) {
        const float width = rng.nextFloat(params.platformWidthMin, params.platformWidthMax);
        const float gap = std::clamp(rng.nextFloat(gapLo, gapHi), 0.0f, maxGap);

        // Long gaps leave less of the arc for climbing
        const float arcRise =
            m_envelope.heightAt(gap + m_generation.landingMargin) * m_generation.reachFraction;
        const float riseLimit = std::max(0.0f, std::min(params.maxRise, arcRise));

        // Negative is up
        const float dy = rng.nextFloat(-riseLimit, dropLimit);
        const float top = std::clamp(prevTop + dy, m_generation.topMargin, m_generation.groundY);

        const float x = prevRight + gap;
        level.platforms.push_back(
            Entity::makePlatform(nextId++, x, top, width, m_generation.platformHeight));

        prevRight = x + width;
        prevTop = top;
    }

    // Enemies and power-ups only on platforms between start and goal
    const size_t firstSpawn = 1;
    const size_t lastSpawn = level.platforms.size() - 1; // exclusive
    std::vector<bool> hasEnemy(level.platforms.size(), false);

    const std::vector<EnemyVariant> unlocked = m_spawnTable.enemiesUnlockedAt(levelIndex);
    int enemiesPlaced = 0;
    for (size_t i = firstSpawn; i < lastSpawn && !unlocked.empty(); ++i) {
        if (enemiesPlaced >= params.maxEnemies) break;
        if (!rng.chance(params.enemyDensity)) continue;

        const AABB surface = level.platforms[i].hitbox();
        const EnemyVariant variant =
            unlocked[static_cast<size_t>(rng.nextInt(0, static_cast<int>(unlocked.size()) - 1))];
        const float centerX = surface.center.getX() + rng.nextFloat(-ENEMY_JITTER, ENEMY_JITTER);
        level.enemies.push_back(
            m_spawnTable.makeEnemy(nextId++, variant, surface, centerX, rng.nextU32()));
        hasEnemy[i] = true;
        ++enemiesPlaced;
    }

    const std::vector<float> weights = m_spawnTable.powerUpWeights();
    for (size_t i = firstSpawn; i < lastSpawn; ++i) {
        // Prefer platforms without an enemy, but allow sharing
        const float density = hasEnemy[i] ? params.powerUpDensity * 0.5f : params.powerUpDensity;
        if (!rng.chance(density)) continue;

        const AABB surface = level.platforms[i].hitbox();
        const auto variant = static_cast<PowerUpVariant>(rng.weightedIndex(weights));
        int coinValue = 1;
        if (variant == PowerUpVariant::Coin) {
            const float roll = rng.nextFloat01();
            coinValue = roll < GOLD_COIN_CHANCE ? 3 : (roll < GOLD_COIN_CHANCE + SILVER_COIN_CHANCE ? 2 : 1);
        }
        const float centerX = surface.left() + surface.width() * rng.nextFloat(0.3f, 0.7f);
        level.powerUps.push_back(m_spawnTable.makePowerUp(nextId++, variant, surface, centerX,
                                                          m_generation.powerUpHover, coinValue));
    }

    const AABB goalSurface = level.platforms.back().hitbox();
    level.goalPosition = goalOnPlatform(goalSurface);
    level.goal = Entity::makeGoal(nextId++, level.goalPosition);

    const AABB startSurface = level.platforms.front().hitbox();
    level.startPosition = Vector2D(START_OFFSET_X, startSurface.top() - PLAYER_HEIGHT);

    const float worldWidth = prevRight + m_generation.worldEndPadding;
    level.bounds = AABB::fromTopLeft(Vector2D(0.0f, 0.0f), worldWidth, m_generation.worldHeight);

    LEVELGEN_INFO(std::format("Generated level {} (seed {}, tier {}): {} platforms, {} enemies, {} power-ups",
                              levelIndex, seed, level.tierName, level.platforms.size(),
                              level.enemies.size(), level.powerUps.size()));
    return level;
}

Level LevelGenerator::buildTutorial(uint64_t seed) {
    Level level;
    level.index = 1;
    level.seed = seed;
    level.tierName = "Tutorial";
    level.tutorial = true;

    EntityID nextId = FIRST_LEVEL_ENTITY_ID;
    for (const auto& p : TUTORIAL_PLATFORMS) {
        level.platforms.push_back(Entity::makePlatform(nextId++, p.x, p.y, p.width, p.height));
    }

    const SpawnTable table;
    const AABB enemySurface = level.platforms[TUTORIAL_ENEMY_PLATFORM].hitbox();
    level.enemies.push_back(table.makeEnemy(nextId++, EnemyVariant::Chaser, enemySurface,
                                            enemySurface.center.getX(), 1u));

    const AABB coinSurface = level.platforms[TUTORIAL_COIN_PLATFORM].hitbox();
    level.powerUps.push_back(table.makePowerUp(nextId++, PowerUpVariant::Coin, coinSurface,
                                               coinSurface.center.getX(), 25.0f, 1));

    const AABB goalSurface = level.platforms.back().hitbox();
    level.goalPosition = goalOnPlatform(goalSurface);
    level.goal = Entity::makeGoal(nextId++, level.goalPosition);

    const AABB startSurface = level.platforms.front().hitbox();
    level.startPosition = Vector2D(START_OFFSET_X, startSurface.top() - PLAYER_HEIGHT);
    level.bounds = AABB::fromTopLeft(Vector2D(0.0f, 0.0f), TUTORIAL_WIDTH, TUTORIAL_HEIGHT);

    LEVELGEN_DEBUG("Built tutorial level");
    return level;
}

} // namespace Skybound
