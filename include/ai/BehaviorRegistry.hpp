/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BEHAVIOR_REGISTRY_HPP
#define BEHAVIOR_REGISTRY_HPP

#include "ai/EntityBehavior.hpp"
#include "world/SpawnTable.hpp"
#include <array>
#include <memory>

namespace Skybound {

/**
 * Owns one behavior instance per enemy variant plus the shared power-up
 * behavior, configured from a SpawnTable.
 */
class BehaviorRegistry {
public:
    explicit BehaviorRegistry(const SpawnTable& spawnTable);

    BehaviorRegistry(const BehaviorRegistry&) = delete;
    BehaviorRegistry& operator=(const BehaviorRegistry&) = delete;

    // nullptr for kinds without behavior (player, platforms, goal)
    const IEntityBehavior* behaviorFor(const Entity& entity) const;

    const IEntityBehavior& enemyBehavior(EnemyVariant variant) const;
    const IEntityBehavior& powerUpBehavior() const { return *m_powerUp; }

private:
    std::array<std::unique_ptr<IEntityBehavior>, ENEMY_VARIANT_COUNT> m_enemies;
    std::unique_ptr<IEntityBehavior> m_powerUp;
};

} // namespace Skybound

#endif // BEHAVIOR_REGISTRY_HPP
