/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/PlayerController.hpp"
#include "core/Logger.hpp"

namespace Skybound {

PlayerController::JumpResult PlayerController::applyInput(Entity& player, PlayerState& state,
                                                          const FrameInput& input,
                                                          const PhysicsConfig& physics) {
    const float accel = state.runAcceleration(physics);

    float ax = 0.0f;
    if (input.moveLeft && !input.moveRight) {
        ax = -accel;
    } else if (input.moveRight && !input.moveLeft) {
        ax = accel;
    }
    player.acceleration = Vector2D(ax, 0.0f);
    player.horizontalInput = ax != 0.0f;

    if (player.grounded) {
        state.onGrounded();
    }

    if (!input.jumpPressed) {
        return JumpResult::None;
    }

    if (player.grounded) {
        player.velocity.setY(-state.jumpSpeed(physics));
        player.grounded = false;
        return JumpResult::Ground;
    }

    if (state.canDoubleJump(player.velocity.getY(), physics.doubleJumpMinVelocityY)) {
        player.velocity.setY(-state.jumpSpeed(physics));
        state.consumeDoubleJump();
        PLAYER_DEBUG("Double jump");
        return JumpResult::Air;
    }

    return JumpResult::None;
}

} // namespace Skybound
