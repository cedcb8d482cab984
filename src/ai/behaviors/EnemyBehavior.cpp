/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/EnemyBehavior.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace Skybound {

CollisionOutcome EnemyBehavior::onCollision(Entity& self, CollisionContext& ctx) const {
    if (!ctx.playerState.takeDamage(1)) {
        return CollisionOutcome::Blocked;
    }

    // Knock the player away from the enemy and slightly up
    const float playerCenter = ctx.player.hitbox().center.getX();
    const float enemyCenter = self.hitbox().center.getX();
    const float direction = playerCenter < enemyCenter ? -1.0f : 1.0f;
    ctx.player.velocity = Vector2D(direction * ctx.session.knockbackX, -ctx.session.knockbackY);
    ctx.player.grounded = false;

    BEHAVIOR_DEBUG(std::format("{} {} hit player, health {}", getName(), self.id,
                               ctx.playerState.getHealth()));
    return CollisionOutcome::DamagedPlayer;
}

void EnemyBehavior::drive(Entity& self, float speed) const {
    const float x = self.position.getX();
    if ((speed > 0.0f && x + speed > self.behavior.maxX) ||
        (speed < 0.0f && x + speed < self.behavior.minX)) {
        speed = std::clamp(x + speed, self.behavior.minX, self.behavior.maxX) - x;
    }
    self.velocity.setX(speed);
    self.acceleration.setX(0.0f);
    self.horizontalInput = true;
}

void EnemyBehavior::idle(Entity& self) const {
    self.acceleration.setX(0.0f);
    self.horizontalInput = false;
}

} // namespace Skybound
