/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/SpawnTable.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace Skybound {

SpawnTable::SpawnTable() {
    EnemySpawn chaser;
    chaser.variant = EnemyVariant::Chaser;
    chaser.width = 28.0f;
    chaser.height = 32.0f;
    chaser.margins = RenderMargins{2.0f, 4.0f, 2.0f, 0.0f};
    chaser.minLevel = 1;
    chaser.moveSpeed = 1.4f;
    chaser.jumpSpeed = 10.0f;
    chaser.sightRange = 200.0f;
    chaser.jumpTrigger = 40.0f;
    setEnemy(chaser);

    EnemySpawn patrol;
    patrol.variant = EnemyVariant::Patrol;
    patrol.width = 40.0f;
    patrol.height = 40.0f;
    patrol.minLevel = 2;
    patrol.moveSpeed = 0.8f;
    patrol.patrolRange = 150.0f;
    setEnemy(patrol);

    EnemySpawn jumper;
    jumper.variant = EnemyVariant::Jumper;
    jumper.width = 35.0f;
    jumper.height = 35.0f;
    jumper.minLevel = 4;
    jumper.moveSpeed = 1.0f;
    jumper.jumpSpeed = 8.0f;
    jumper.minJumpInterval = 60;
    jumper.maxJumpInterval = 120;
    setEnemy(jumper);

    EnemySpawn shooter;
    shooter.variant = EnemyVariant::Shooter;
    shooter.width = 45.0f;
    shooter.height = 45.0f;
    shooter.minLevel = 6;
    shooter.moveSpeed = 0.0f;
    shooter.sightRange = 200.0f;
    shooter.shotInterval = 120;
    setEnemy(shooter);

    EnemySpawn projectile;
    projectile.variant = EnemyVariant::Projectile;
    projectile.width = 8.0f;
    projectile.height = 8.0f;
    projectile.moveSpeed = 3.0f;
    projectile.lifetimeTicks = 180;
    projectile.placeable = false;
    setEnemy(projectile);

    //                 variant                        w      h      weight  duration
    setPowerUp(PowerUpSpawn{PowerUpVariant::SpeedBoost, 20.0f, 20.0f, 15.0f, 300});
    setPowerUp(PowerUpSpawn{PowerUpVariant::JumpBoost, 20.0f, 20.0f, 15.0f, 300});
    setPowerUp(PowerUpSpawn{PowerUpVariant::HealthPotion, 20.0f, 20.0f, 10.0f, 0});
    setPowerUp(PowerUpSpawn{PowerUpVariant::Coin, 16.0f, 16.0f, 30.0f, 0});
    setPowerUp(PowerUpSpawn{PowerUpVariant::Shield, 20.0f, 20.0f, 8.0f, 1800});
    setPowerUp(PowerUpSpawn{PowerUpVariant::DoubleJump, 20.0f, 20.0f, 12.0f, 240});
}

const EnemySpawn& SpawnTable::enemy(EnemyVariant variant) const {
    auto it = m_enemies.find(variant);
    if (it == m_enemies.end()) {
        throw std::out_of_range(std::format("No spawn row for enemy variant {}", toString(variant)));
    }
    return it->second;
}

const PowerUpSpawn& SpawnTable::powerUp(PowerUpVariant variant) const {
    auto it = m_powerUps.find(variant);
    if (it == m_powerUps.end()) {
        throw std::out_of_range(std::format("No spawn row for power-up variant {}", toString(variant)));
    }
    return it->second;
}

std::vector<EnemyVariant> SpawnTable::enemiesUnlockedAt(int levelIndex) const {
    std::vector<EnemyVariant> unlocked;
    for (const auto& [variant, spawn] : m_enemies) {
        if (spawn.placeable && spawn.minLevel <= levelIndex) {
            unlocked.push_back(variant);
        }
    }
    return unlocked;
}

std::vector<float> SpawnTable::powerUpWeights() const {
    std::vector<float> weights(POWERUP_VARIANT_COUNT, 0.0f);
    for (const auto& [variant, spawn] : m_powerUps) {
        weights[static_cast<size_t>(variant)] = spawn.weight;
    }
    return weights;
}

Entity SpawnTable::makeEnemy(EntityID id, EnemyVariant variant, const AABB& platform,
                             float centerX, uint32_t aiSeed) const {
    const EnemySpawn& spawn = enemy(variant);

    const float minX = platform.left();
    const float maxX = std::max(minX, platform.right() - spawn.width);
    const float x = std::clamp(centerX - spawn.width * 0.5f, minX, maxX);

    Entity e;
    e.id = id;
    e.kind = EntityKind::Enemy;
    e.variant = static_cast<uint8_t>(variant);
    e.position = Vector2D(x, platform.top() - spawn.height);
    e.hitboxSize = Vector2D(spawn.width, spawn.height);
    e.margins = spawn.margins;
    e.isStatic = false;
    e.grounded = true;

    e.behavior.originX = x;
    e.behavior.minX = minX;
    e.behavior.maxX = maxX;
    e.behavior.direction = (aiSeed & 1u) ? 1.0f : -1.0f;
    e.behavior.rngState = aiSeed;
    e.behavior.interval = spawn.maxJumpInterval;
    return e;
}

Entity SpawnTable::makeProjectile(EntityID id, const Vector2D& origin, const Vector2D& target,
                                  float fallbackDirection) const {
    const EnemySpawn& spawn = enemy(EnemyVariant::Projectile);

    Vector2D aim = target - origin;
    const float distance = aim.length();
    if (distance > 0.0f) {
        aim = aim * (1.0f / distance);
    } else {
        aim = Vector2D(fallbackDirection < 0.0f ? -1.0f : 1.0f, 0.0f);
    }

    Entity e;
    e.id = id;
    e.kind = EntityKind::Enemy;
    e.variant = static_cast<uint8_t>(EnemyVariant::Projectile);
    e.position = Vector2D(origin.getX() - spawn.width * 0.5f, origin.getY() - spawn.height * 0.5f);
    e.velocity = aim * spawn.moveSpeed;
    e.hitboxSize = Vector2D(spawn.width, spawn.height);
    e.margins = spawn.margins;
    e.gravityScale = 0.0f;
    e.isStatic = false;
    e.horizontalInput = true;

    e.behavior.direction = aim.getX() < 0.0f ? -1.0f : 1.0f;
    e.behavior.interval = spawn.lifetimeTicks;
    return e;
}

Entity SpawnTable::makePowerUp(EntityID id, PowerUpVariant variant, const AABB& platform,
                               float centerX, float hover, int coinValue) const {
    const PowerUpSpawn& spawn = powerUp(variant);

    const float minX = platform.left();
    const float maxX = std::max(minX, platform.right() - spawn.width);
    const float x = std::clamp(centerX - spawn.width * 0.5f, minX, maxX);
    const float y = platform.top() - hover - spawn.height;

    Entity e;
    e.id = id;
    e.kind = EntityKind::PowerUp;
    e.variant = static_cast<uint8_t>(variant);
    e.position = Vector2D(x, y);
    e.hitboxSize = Vector2D(spawn.width, spawn.height);
    e.margins = RenderMargins{2.0f, 2.0f, 2.0f, 2.0f};
    e.isStatic = true;

    e.behavior.originX = x;
    e.behavior.baseY = y;
    e.behavior.value = variant == PowerUpVariant::Coin ? std::max(1, coinValue) : 0;
    e.behavior.interval = spawn.durationTicks;
    return e;
}

} // namespace Skybound
