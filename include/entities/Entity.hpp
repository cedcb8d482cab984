/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include "collisions/AABB.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <ostream>

namespace Skybound {

using EntityID = uint32_t;

constexpr EntityID INVALID_ENTITY_ID = 0;
constexpr EntityID PLAYER_ENTITY_ID = 1;

enum class EntityKind : uint8_t { Player, Enemy, Platform, PowerUp, Goal };

// Projectiles are fired by Shooters and never placed by the generator
enum class EnemyVariant : uint8_t { Chaser, Patrol, Jumper, Shooter, Projectile };

enum class PowerUpVariant : uint8_t {
    SpeedBoost,
    JumpBoost,
    HealthPotion,
    Coin,
    Shield,
    DoubleJump
};

constexpr size_t ENEMY_VARIANT_COUNT = 5;
constexpr size_t POWERUP_VARIANT_COUNT = 6;

const char* toString(EntityKind kind);
const char* toString(EnemyVariant variant);
const char* toString(PowerUpVariant variant);

inline std::ostream& operator<<(std::ostream& os, EntityKind kind) { return os << toString(kind); }
inline std::ostream& operator<<(std::ostream& os, EnemyVariant v) { return os << toString(v); }
inline std::ostream& operator<<(std::ostream& os, PowerUpVariant v) { return os << toString(v); }

/**
 * Visual overhang around the hitbox. All margins are non-negative, so the
 * hitbox is always contained in the render bounds.
 */
struct RenderMargins {
    float left{0.0f};
    float top{0.0f};
    float right{0.0f};
    float bottom{0.0f};
};

/**
 * Per-entity scratch state used by the variant behaviors. The behavior
 * objects themselves are stateless and shared between entities.
 */
struct BehaviorState {
    float originX{0.0f};     // patrol anchor
    float minX{0.0f};        // home platform extents, enemies never walk off them
    float maxX{0.0f};
    float baseY{0.0f};       // hover anchor for power-ups
    float direction{1.0f};   // +1 right, -1 left
    int timer{0};            // ticks since the last action
    int interval{0};         // ticks until the next action, or a projectile's lifetime
    int value{0};            // coin value for Coin power-ups
    uint32_t rngState{0};    // private stream so AI never touches the level RNG
    bool expired{false};     // removed by the session at the end of the phase
};

/**
 * Shared representation of everything placed in a level.
 *
 * position is the top-left corner of the hitbox, y grows downward. Position
 * only changes when the session commits a resolved delta.
 */
struct Entity {
    EntityID id{INVALID_ENTITY_ID};
    EntityKind kind{EntityKind::Platform};
    uint8_t variant{0};

    Vector2D position;
    Vector2D velocity;
    Vector2D acceleration;
    Vector2D hitboxSize;
    RenderMargins margins;

    float gravityScale{1.0f};

    bool isStatic{true};
    bool grounded{false};
    bool horizontalInput{false}; // run input or AI drive this tick; friction applies otherwise

    BehaviorState behavior;

    AABB hitbox() const;
    AABB renderBounds() const;

    bool isSolid() const { return kind == EntityKind::Platform; }
    bool isTrigger() const {
        return kind == EntityKind::Enemy || kind == EntityKind::PowerUp ||
               kind == EntityKind::Goal;
    }

    EnemyVariant enemyVariant() const { return static_cast<EnemyVariant>(variant); }
    PowerUpVariant powerUpVariant() const { return static_cast<PowerUpVariant>(variant); }

    static Entity makePlatform(EntityID id, float x, float y, float width, float height);
    static Entity makePlayer(const Vector2D& topLeft);
    static Entity makeGoal(EntityID id, const Vector2D& topLeft);
};

// Player hitbox and sprite overhang
constexpr float PLAYER_WIDTH = 30.0f;
constexpr float PLAYER_HEIGHT = 40.0f;
constexpr float GOAL_WIDTH = 20.0f;
constexpr float GOAL_HEIGHT = 40.0f;

} // namespace Skybound

#endif // ENTITY_HPP
