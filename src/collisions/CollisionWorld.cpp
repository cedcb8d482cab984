/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionWorld.hpp"
#include "core/Logger.hpp"
#include <format>

namespace Skybound {

CollisionWorld::CollisionWorld(float cellSize) : m_broadPhase(cellSize) {}

void CollisionWorld::add(const Entity& entity) {
    if (entity.id == INVALID_ENTITY_ID) {
        COLLISION_ERROR("Refusing to add entity without an id");
        return;
    }
    auto [it, inserted] = m_entities.insert_or_assign(entity.id, entity);
    if (!inserted) {
        COLLISION_WARN(std::format("Entity {} replaced in collision world", entity.id));
    }
    m_broadPhase.update(entity.id, it->second.hitbox());
}

bool CollisionWorld::remove(EntityID id) {
    auto it = m_entities.find(id);
    if (it == m_entities.end()) {
        return false;
    }
    m_broadPhase.remove(id);
    m_entities.erase(it);
    return true;
}

void CollisionWorld::clear() {
    m_entities.clear();
    m_broadPhase.clear();
}

Entity* CollisionWorld::find(EntityID id) {
    auto it = m_entities.find(id);
    return it == m_entities.end() ? nullptr : &it->second;
}

const Entity* CollisionWorld::find(EntityID id) const {
    auto it = m_entities.find(id);
    return it == m_entities.end() ? nullptr : &it->second;
}

void CollisionWorld::refresh(EntityID id) {
    if (const Entity* e = find(id)) {
        m_broadPhase.update(id, e->hitbox());
    }
}

void CollisionWorld::query(const AABB& area, std::vector<EntityID>& out) const {
    m_broadPhase.query(area, out);
}

} // namespace Skybound
