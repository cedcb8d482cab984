/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Entity.hpp"
#include <algorithm>

namespace Skybound {

const char* toString(EntityKind kind) {
    switch (kind) {
    case EntityKind::Player:
        return "Player";
    case EntityKind::Enemy:
        return "Enemy";
    case EntityKind::Platform:
        return "Platform";
    case EntityKind::PowerUp:
        return "PowerUp";
    case EntityKind::Goal:
        return "Goal";
    }
    return "Unknown";
}

const char* toString(EnemyVariant variant) {
    switch (variant) {
    case EnemyVariant::Chaser:
        return "Chaser";
    case EnemyVariant::Patrol:
        return "Patrol";
    case EnemyVariant::Jumper:
        return "Jumper";
    case EnemyVariant::Shooter:
        return "Shooter";
    case EnemyVariant::Projectile:
        return "Projectile";
    }
    return "Unknown";
}

const char* toString(PowerUpVariant variant) {
    switch (variant) {
    case PowerUpVariant::SpeedBoost:
        return "SpeedBoost";
    case PowerUpVariant::JumpBoost:
        return "JumpBoost";
    case PowerUpVariant::HealthPotion:
        return "HealthPotion";
    case PowerUpVariant::Coin:
        return "Coin";
    case PowerUpVariant::Shield:
        return "Shield";
    case PowerUpVariant::DoubleJump:
        return "DoubleJump";
    }
    return "Unknown";
}

AABB Entity::hitbox() const {
    return AABB::fromTopLeft(position, hitboxSize.getX(), hitboxSize.getY());
}

AABB Entity::renderBounds() const {
    const float l = std::max(0.0f, margins.left);
    const float t = std::max(0.0f, margins.top);
    const float r = std::max(0.0f, margins.right);
    const float b = std::max(0.0f, margins.bottom);
    return AABB::fromTopLeft(Vector2D(position.getX() - l, position.getY() - t),
                             hitboxSize.getX() + l + r, hitboxSize.getY() + t + b);
}

Entity Entity::makePlatform(EntityID id, float x, float y, float width, float height) {
    Entity e;
    e.id = id;
    e.kind = EntityKind::Platform;
    e.position = Vector2D(x, y);
    e.hitboxSize = Vector2D(width, height);
    e.isStatic = true;
    return e;
}

Entity Entity::makePlayer(const Vector2D& topLeft) {
    Entity e;
    e.id = PLAYER_ENTITY_ID;
    e.kind = EntityKind::Player;
    e.position = topLeft;
    e.hitboxSize = Vector2D(PLAYER_WIDTH, PLAYER_HEIGHT);
    e.margins = RenderMargins{5.0f, 8.0f, 5.0f, 0.0f};
    e.isStatic = false;
    return e;
}

Entity Entity::makeGoal(EntityID id, const Vector2D& topLeft) {
    Entity e;
    e.id = id;
    e.kind = EntityKind::Goal;
    e.position = topLeft;
    e.hitboxSize = Vector2D(GOAL_WIDTH, GOAL_HEIGHT);
    e.margins = RenderMargins{4.0f, 4.0f, 4.0f, 0.0f};
    e.isStatic = true;
    return e;
}

} // namespace Skybound
