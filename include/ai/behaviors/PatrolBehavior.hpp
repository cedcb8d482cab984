/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATROL_BEHAVIOR_HPP
#define PATROL_BEHAVIOR_HPP

#include "ai/behaviors/EnemyBehavior.hpp"

namespace Skybound {

// Walks back and forth around its spawn point, turning at the patrol range or a platform edge
class PatrolBehavior : public EnemyBehavior {
public:
    explicit PatrolBehavior(const EnemySpawn& spawn) : EnemyBehavior(spawn) {}

    void updateBehavior(Entity& self, const BehaviorContext& ctx) const override;
    std::string getName() const override { return "Patrol"; }
};

} // namespace Skybound

#endif // PATROL_BEHAVIOR_HPP
