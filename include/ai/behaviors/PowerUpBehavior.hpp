/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POWERUP_BEHAVIOR_HPP
#define POWERUP_BEHAVIOR_HPP

#include "ai/EntityBehavior.hpp"

namespace Skybound {

/**
 * Shared by every power-up variant. Bobs the pickup around its hover
 * height and applies its effect when the player touches it.
 */
class PowerUpBehavior : public IEntityBehavior {
public:
    static constexpr float BOB_AMPLITUDE = 3.0f;
    static constexpr float BOB_FREQUENCY = 0.1f; // radians per tick

    void updateBehavior(Entity& self, const BehaviorContext& ctx) const override;
    CollisionOutcome onCollision(Entity& self, CollisionContext& ctx) const override;
    std::string getName() const override { return "PowerUp"; }
};

} // namespace Skybound

#endif // POWERUP_BEHAVIOR_HPP
