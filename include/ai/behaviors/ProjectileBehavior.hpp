/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PROJECTILE_BEHAVIOR_HPP
#define PROJECTILE_BEHAVIOR_HPP

#include "ai/behaviors/EnemyBehavior.hpp"

namespace Skybound {

/**
 * Straight-line shot with a fixed lifetime. Damages like any enemy on
 * contact and is spent by the contact whether or not the damage landed.
 */
class ProjectileBehavior : public EnemyBehavior {
public:
    explicit ProjectileBehavior(const EnemySpawn& spawn) : EnemyBehavior(spawn) {}

    void updateBehavior(Entity& self, const BehaviorContext& ctx) const override;
    CollisionOutcome onCollision(Entity& self, CollisionContext& ctx) const override;
    std::string getName() const override { return "Projectile"; }
};

} // namespace Skybound

#endif // PROJECTILE_BEHAVIOR_HPP
