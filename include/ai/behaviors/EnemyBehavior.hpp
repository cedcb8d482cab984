/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENEMY_BEHAVIOR_HPP
#define ENEMY_BEHAVIOR_HPP

#include "ai/EntityBehavior.hpp"
#include "world/SpawnTable.hpp"

namespace Skybound {

/**
 * Shared base for enemy variants: contact damage with knockback, and the
 * rule that enemies never walk off their home platform.
 */
class EnemyBehavior : public IEntityBehavior {
public:
    explicit EnemyBehavior(const EnemySpawn& spawn) : m_spawn(spawn) {}

    CollisionOutcome onCollision(Entity& self, CollisionContext& ctx) const override;

    const EnemySpawn& getSpawn() const { return m_spawn; }

protected:
    EnemySpawn m_spawn;

    // Drives the entity horizontally at speed (signed), stopping at platform edges
    void drive(Entity& self, float speed) const;
    void idle(Entity& self) const;
};

} // namespace Skybound

#endif // ENEMY_BEHAVIOR_HPP
