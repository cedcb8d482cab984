/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/JumperBehavior.hpp"
#include "utils/SeededRandom.hpp"

namespace Skybound {

void JumperBehavior::updateBehavior(Entity& self, const BehaviorContext& /*ctx*/) const {
    BehaviorState& state = self.behavior;

    if (!self.grounded) {
        // Keep the drift picked at take-off, but never past the platform
        drive(self, self.velocity.getX());
        return;
    }

    drive(self, 0.0f);
    ++state.timer;
    if (state.timer < state.interval) {
        return;
    }

    state.timer = 0;
    state.interval = nextInterval(state);

    // Drift in [-moveSpeed, moveSpeed]
    const float unit = static_cast<float>(xorshift32(state.rngState) & 0xFFFFu) / 65535.0f;
    const float drift = (unit * 2.0f - 1.0f) * m_spawn.moveSpeed;
    drive(self, drift);
    self.velocity.setY(-m_spawn.jumpSpeed);
    self.grounded = false;
}

int JumperBehavior::nextInterval(BehaviorState& state) const {
    const int lo = m_spawn.minJumpInterval;
    const int hi = m_spawn.maxJumpInterval;
    if (hi <= lo) {
        return lo;
    }
    const uint32_t span = static_cast<uint32_t>(hi - lo + 1);
    return lo + static_cast<int>(xorshift32(state.rngState) % span);
}

} // namespace Skybound
