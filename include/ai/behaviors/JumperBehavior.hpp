/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef JUMPER_BEHAVIOR_HPP
#define JUMPER_BEHAVIOR_HPP

#include "ai/behaviors/EnemyBehavior.hpp"

namespace Skybound {

/**
 * Hops in place at a random interval between the spawn row's minimum and
 * maximum, drifting a little sideways on each hop.
 */
class JumperBehavior : public EnemyBehavior {
public:
    explicit JumperBehavior(const EnemySpawn& spawn) : EnemyBehavior(spawn) {}

    void updateBehavior(Entity& self, const BehaviorContext& ctx) const override;
    std::string getName() const override { return "Jumper"; }

private:
    int nextInterval(BehaviorState& state) const;
};

} // namespace Skybound

#endif // JUMPER_BEHAVIOR_HPP
