/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_WORLD_HPP
#define COLLISION_WORLD_HPP

#include "collisions/SpatialHash.hpp"
#include "entities/Entity.hpp"
#include <boost/container/flat_map.hpp>
#include <vector>

namespace Skybound {

/**
 * Mutable working set of a level: every non-player entity keyed by id, with
 * the spatial hash kept in sync. Iteration is in ascending id order, which
 * keeps AI updates and event ordering reproducible.
 */
class CollisionWorld {
public:
    using Container = boost::container::flat_map<EntityID, Entity>;

    explicit CollisionWorld(float cellSize = 64.0f);

    void add(const Entity& entity);
    bool remove(EntityID id);
    void clear();

    Entity* find(EntityID id);
    const Entity* find(EntityID id) const;

    // Re-buckets an entity after its position changed
    void refresh(EntityID id);

    void query(const AABB& area, std::vector<EntityID>& out) const;

    size_t size() const { return m_entities.size(); }
    bool empty() const { return m_entities.empty(); }

    Container& entities() { return m_entities; }
    const Container& entities() const { return m_entities; }

private:
    Container m_entities;
    SpatialHash m_broadPhase;
};

} // namespace Skybound

#endif // COLLISION_WORLD_HPP
