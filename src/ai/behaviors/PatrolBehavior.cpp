/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/PatrolBehavior.hpp"

namespace Skybound {

void PatrolBehavior::updateBehavior(Entity& self, const BehaviorContext& /*ctx*/) const {
    BehaviorState& state = self.behavior;
    const float x = self.position.getX();
    const float offset = x - state.originX;

    if (m_spawn.patrolRange > 0.0f) {
        if (offset >= m_spawn.patrolRange && state.direction > 0.0f) {
            state.direction = -1.0f;
        } else if (offset <= -m_spawn.patrolRange && state.direction < 0.0f) {
            state.direction = 1.0f;
        }
    }

    if (state.direction > 0.0f && x >= state.maxX) {
        state.direction = -1.0f;
    } else if (state.direction < 0.0f && x <= state.minX) {
        state.direction = 1.0f;
    }

    drive(self, state.direction * m_spawn.moveSpeed);
}

} // namespace Skybound
