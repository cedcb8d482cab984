/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SHOOTER_BEHAVIOR_HPP
#define SHOOTER_BEHAVIOR_HPP

#include "ai/behaviors/EnemyBehavior.hpp"

namespace Skybound {

/**
 * Stands its ground and fires at the player. The shot timer keeps running
 * while the player is out of range, so the first shot comes as soon as the
 * player walks into sight.
 */
class ShooterBehavior : public EnemyBehavior {
public:
    explicit ShooterBehavior(const EnemySpawn& spawn) : EnemyBehavior(spawn) {}

    void updateBehavior(Entity& self, const BehaviorContext& ctx) const override;
    std::string getName() const override { return "Shooter"; }
};

} // namespace Skybound

#endif // SHOOTER_BEHAVIOR_HPP
