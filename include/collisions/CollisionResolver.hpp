/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_RESOLVER_HPP
#define COLLISION_RESOLVER_HPP

#include "collisions/AABB.hpp"
#include "collisions/CollisionWorld.hpp"
#include "entities/Entity.hpp"
#include "events/GameEvent.hpp"
#include "utils/Vector2D.hpp"
#include <vector>

namespace Skybound {

struct ResolveResult {
    Vector2D correctedDelta;
    Vector2D velocity;
    bool grounded{false};
    bool hitCeiling{false};
    bool hitWall{false};
    GameEventList events;
};

/**
 * Broad and narrow phase for one moving entity against the level.
 *
 * The broad phase queries the spatial hash with the swept box of the move.
 * The narrow phase sweeps the vertical axis first, testing x-overlap at the
 * moment the mover crosses each surface, then the horizontal axis at the
 * corrected height. Triggers are tested along the corrected path. Sweeps compare edges
 * before and after the move, so no speed up to terminal velocity can pass
 * through a platform.
 *
 * Contacts with enemies, power-ups and the goal never correct the move; they
 * are reported as events for the player only. Nothing outside the returned
 * result is modified.
 */
class CollisionResolver {
public:
    /**
     * @param skin tolerance used when comparing edges (pixels)
     * @param broadPhaseMargin padding added to the swept query box
     */
    explicit CollisionResolver(float skin = 0.01f, float broadPhaseMargin = 4.0f);

    ResolveResult resolve(const Entity& mover, const Vector2D& velocity,
                          const Vector2D& delta, const CollisionWorld& world) const;

private:
    float m_skin;
    float m_broadPhaseMargin;

    // Reused between calls; resolve() stays logically const
    mutable std::vector<EntityID> m_candidates;

    Vector2D pushOutOfSolids(const AABB& box, const std::vector<const Entity*>& solids,
                             ResolveResult& result) const;
    float sweepVertical(const AABB& box, const Vector2D& delta,
                        const std::vector<const Entity*>& solids, const Entity*& hit) const;
    float sweepHorizontal(const AABB& box, float dx, const std::vector<const Entity*>& solids,
                          const Entity*& hit) const;
    bool supportedBelow(const AABB& box, const std::vector<const Entity*>& solids) const;
};

} // namespace Skybound

#endif // COLLISION_RESOLVER_HPP
