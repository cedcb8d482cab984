/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/ShooterBehavior.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <format>

namespace Skybound {

void ShooterBehavior::updateBehavior(Entity& self, const BehaviorContext& ctx) const {
    idle(self);

    BehaviorState& state = self.behavior;
    if (state.timer < m_spawn.shotInterval) {
        ++state.timer;
    }
    if (!ctx.player || !ctx.shots || state.timer < m_spawn.shotInterval) {
        return;
    }

    const Vector2D origin = self.hitbox().center;
    const Vector2D target = ctx.player->hitbox().center;
    const float dx = target.getX() - origin.getX();
    if (std::fabs(dx) >= m_spawn.sightRange) {
        return;
    }

    state.direction = dx < 0.0f ? -1.0f : 1.0f;
    state.timer = 0;
    ctx.shots->push_back(ProjectileShot{self.id, origin, target, state.direction});
    BEHAVIOR_DEBUG(std::format("Shooter {} fired at ({:.1f}, {:.1f})", self.id, target.getX(),
                               target.getY()));
}

} // namespace Skybound
