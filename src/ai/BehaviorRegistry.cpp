/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/BehaviorRegistry.hpp"
#include "ai/behaviors/ChaseBehavior.hpp"
#include "ai/behaviors/JumperBehavior.hpp"
#include "ai/behaviors/PatrolBehavior.hpp"
#include "ai/behaviors/PowerUpBehavior.hpp"
#include "ai/behaviors/ProjectileBehavior.hpp"
#include "ai/behaviors/ShooterBehavior.hpp"
#include "core/Logger.hpp"
#include <format>
#include <stdexcept>

namespace Skybound {

BehaviorRegistry::BehaviorRegistry(const SpawnTable& spawnTable) {
    m_enemies[static_cast<size_t>(EnemyVariant::Chaser)] =
        std::make_unique<ChaseBehavior>(spawnTable.enemy(EnemyVariant::Chaser));
    m_enemies[static_cast<size_t>(EnemyVariant::Patrol)] =
        std::make_unique<PatrolBehavior>(spawnTable.enemy(EnemyVariant::Patrol));
    m_enemies[static_cast<size_t>(EnemyVariant::Jumper)] =
        std::make_unique<JumperBehavior>(spawnTable.enemy(EnemyVariant::Jumper));
    m_enemies[static_cast<size_t>(EnemyVariant::Shooter)] =
        std::make_unique<ShooterBehavior>(spawnTable.enemy(EnemyVariant::Shooter));
    m_enemies[static_cast<size_t>(EnemyVariant::Projectile)] =
        std::make_unique<ProjectileBehavior>(spawnTable.enemy(EnemyVariant::Projectile));
    m_powerUp = std::make_unique<PowerUpBehavior>();

    BEHAVIOR_DEBUG(std::format("Registered {} enemy behaviors", m_enemies.size()));
}

const IEntityBehavior* BehaviorRegistry::behaviorFor(const Entity& entity) const {
    switch (entity.kind) {
    case EntityKind::Enemy:
        return &enemyBehavior(entity.enemyVariant());
    case EntityKind::PowerUp:
        return m_powerUp.get();
    default:
        return nullptr;
    }
}

const IEntityBehavior& BehaviorRegistry::enemyBehavior(EnemyVariant variant) const {
    const auto index = static_cast<size_t>(variant);
    if (index >= m_enemies.size()) {
        throw std::out_of_range(std::format("Unknown enemy variant {}", index));
    }
    return *m_enemies[index];
}

} // namespace Skybound
