/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/ChaseBehavior.hpp"
#include <cmath>

namespace Skybound {

namespace {
// Ignore the player when it is this far above or below
constexpr float VERTICAL_SIGHT = 150.0f;
} // namespace

void ChaseBehavior::updateBehavior(Entity& self, const BehaviorContext& ctx) const {
    if (!ctx.player) {
        idle(self);
        return;
    }

    const Vector2D selfCenter = self.hitbox().center;
    const Vector2D playerCenter = ctx.player->hitbox().center;
    const float dx = playerCenter.getX() - selfCenter.getX();
    const float dy = playerCenter.getY() - selfCenter.getY();

    if (std::abs(dx) > m_spawn.sightRange || std::abs(dy) > VERTICAL_SIGHT) {
        idle(self);
        return;
    }

    self.behavior.direction = dx < 0.0f ? -1.0f : 1.0f;
    if (std::abs(dx) < 1.0f) {
        drive(self, 0.0f);
    } else {
        drive(self, self.behavior.direction * m_spawn.moveSpeed);
    }

    // Player is above by at least the trigger distance
    if (self.grounded && -dy >= m_spawn.jumpTrigger && m_spawn.jumpSpeed > 0.0f) {
        self.velocity.setY(-m_spawn.jumpSpeed);
        self.grounded = false;
    }
}

} // namespace Skybound
