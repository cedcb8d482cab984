/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/ProjectileBehavior.hpp"

namespace Skybound {

void ProjectileBehavior::updateBehavior(Entity& self, const BehaviorContext& /*ctx*/) const {
    // Velocity is set at launch; keep friction off so it never slows down
    self.acceleration = Vector2D(0.0f, 0.0f);
    self.horizontalInput = true;

    BehaviorState& state = self.behavior;
    if (++state.timer >= state.interval) {
        state.expired = true;
    }
}

CollisionOutcome ProjectileBehavior::onCollision(Entity& self, CollisionContext& ctx) const {
    const CollisionOutcome outcome = EnemyBehavior::onCollision(self, ctx);
    self.behavior.expired = true;
    return outcome;
}

} // namespace Skybound
