/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CHASE_BEHAVIOR_HPP
#define CHASE_BEHAVIOR_HPP

#include "ai/behaviors/EnemyBehavior.hpp"

namespace Skybound {

/**
 * Runs toward the player once within sight range and hops when the player
 * is standing noticeably higher. Idles otherwise.
 */
class ChaseBehavior : public EnemyBehavior {
public:
    explicit ChaseBehavior(const EnemySpawn& spawn) : EnemyBehavior(spawn) {}

    void updateBehavior(Entity& self, const BehaviorContext& ctx) const override;
    std::string getName() const override { return "Chase"; }
};

} // namespace Skybound

#endif // CHASE_BEHAVIOR_HPP
