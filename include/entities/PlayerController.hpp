/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLAYER_CONTROLLER_HPP
#define PLAYER_CONTROLLER_HPP

#include "core/GameConfig.hpp"
#include "entities/Entity.hpp"
#include "entities/PlayerState.hpp"
#include "input/InputSource.hpp"

namespace Skybound {

/**
 * Turns frame input into acceleration and jump impulses on the player body.
 * Runs before the integrator each tick and never moves the player itself.
 */
class PlayerController {
public:
    // What happened this tick, for effects and tests
    enum class JumpResult { None, Ground, Air };

    static JumpResult applyInput(Entity& player, PlayerState& state, const FrameInput& input,
                                 const PhysicsConfig& physics);
};

} // namespace Skybound

#endif // PLAYER_CONTROLLER_HPP
