/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/PowerUpBehavior.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <format>

namespace Skybound {

void PowerUpBehavior::updateBehavior(Entity& self, const BehaviorContext& ctx) const {
    // Offset the phase by id so neighbouring pickups don't bob in lockstep
    const float phase = static_cast<float>(self.id % 16u) * 0.4f;
    const float t = static_cast<float>(ctx.tick) * BOB_FREQUENCY + phase;
    self.position.setY(self.behavior.baseY + BOB_AMPLITUDE * std::sin(t));
}

CollisionOutcome PowerUpBehavior::onCollision(Entity& self, CollisionContext& ctx) const {
    const PowerUpVariant variant = self.powerUpVariant();
    ctx.playerState.applyPowerUp(variant, self.behavior.interval, self.behavior.value);
    BEHAVIOR_DEBUG(std::format("Player collected {} ({})", toString(variant), self.id));
    return CollisionOutcome::Consumed;
}

} // namespace Skybound
