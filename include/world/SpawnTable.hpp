/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPAWN_TABLE_HPP
#define SPAWN_TABLE_HPP

#include "collisions/AABB.hpp"
#include "entities/Entity.hpp"
#include "utils/Vector2D.hpp"
#include <boost/container/flat_map.hpp>
#include <vector>

namespace Skybound {

struct EnemySpawn {
    EnemyVariant variant{EnemyVariant::Chaser};
    float width{28.0f};
    float height{32.0f};
    RenderMargins margins;
    int minLevel{1};          // first level index the variant may appear on
    float moveSpeed{1.0f};    // px/tick
    float patrolRange{0.0f};  // Patrol: distance from origin before turning
    float jumpSpeed{0.0f};
    int minJumpInterval{0};   // Jumper: ticks between hops
    int maxJumpInterval{0};
    float sightRange{0.0f};   // Chaser: horizontal distance at which it notices the player
    float jumpTrigger{0.0f};  // Chaser: jumps when the player is this much higher
    int shotInterval{0};      // Shooter: minimum ticks between shots
    int lifetimeTicks{0};     // Projectile: ticks before it disappears
    bool placeable{true};     // false for variants only created at runtime
};

struct PowerUpSpawn {
    PowerUpVariant variant{PowerUpVariant::Coin};
    float width{20.0f};
    float height{20.0f};
    float weight{1.0f};       // relative spawn weight
    int durationTicks{0};     // 0 for instant effects
};

/**
 * Data-driven spawn parameters for every enemy and power-up variant, plus
 * the factory that turns a table row into a placed entity.
 */
class SpawnTable {
public:
    // Populated with the built-in variant rows
    SpawnTable();

    const EnemySpawn& enemy(EnemyVariant variant) const;
    const PowerUpSpawn& powerUp(PowerUpVariant variant) const;

    void setEnemy(const EnemySpawn& spawn) { m_enemies[spawn.variant] = spawn; }
    void setPowerUp(const PowerUpSpawn& spawn) { m_powerUps[spawn.variant] = spawn; }

    // Placeable variants whose minLevel has been reached, in enum order
    std::vector<EnemyVariant> enemiesUnlockedAt(int levelIndex) const;

    // Weights in PowerUpVariant order, for SeededRandom::weightedIndex
    std::vector<float> powerUpWeights() const;

    /**
     * Places an enemy standing on the platform, centred on centerX and kept
     * inside the platform's horizontal extent.
     */
    Entity makeEnemy(EntityID id, EnemyVariant variant, const AABB& platform, float centerX,
                     uint32_t aiSeed) const;

    /**
     * Creates a projectile centred on origin, flying towards target at the
     * Projectile row's speed. A zero-length aim fires along fallbackDirection.
     */
    Entity makeProjectile(EntityID id, const Vector2D& origin, const Vector2D& target,
                          float fallbackDirection) const;

    /**
     * Places a power-up hovering above the platform surface.
     */
    Entity makePowerUp(EntityID id, PowerUpVariant variant, const AABB& platform, float centerX,
                       float hover, int coinValue) const;

private:
    boost::container::flat_map<EnemyVariant, EnemySpawn> m_enemies;
    boost::container::flat_map<PowerUpVariant, PowerUpSpawn> m_powerUps;
};

} // namespace Skybound

#endif // SPAWN_TABLE_HPP
