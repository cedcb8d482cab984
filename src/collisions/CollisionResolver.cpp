/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionResolver.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace Skybound {

namespace {

bool overlapsOnX(const AABB& a, const AABB& b) {
    return a.left() < b.right() && a.right() > b.left();
}

// Shallower than skin on Y is a resting contact, not a wall
bool overlapsOnY(const AABB& a, const AABB& b, float skin) {
    return a.top() < b.bottom() - skin && a.bottom() > b.top() + skin;
}

// Fraction of the move at which an edge at `from` reaches `to`
float crossingTime(float from, float to, float distance) {
    return std::clamp((to - from) / distance, 0.0f, 1.0f);
}

GameEventType triggerEventFor(EntityKind kind) {
    switch (kind) {
    case EntityKind::Enemy:
        return GameEventType::EnemyHit;
    case EntityKind::PowerUp:
        return GameEventType::PowerUpCollected;
    case EntityKind::Goal:
    default:
        return GameEventType::GoalReached;
    }
}

} // namespace

CollisionResolver::CollisionResolver(float skin, float broadPhaseMargin)
    : m_skin(skin), m_broadPhaseMargin(broadPhaseMargin) {}

ResolveResult CollisionResolver::resolve(const Entity& mover, const Vector2D& velocity,
                                         const Vector2D& delta, const CollisionWorld& world) const {
    ResolveResult result;
    result.velocity = velocity;

    if (mover.isStatic) {
        result.velocity = Vector2D();
        return result;
    }

    const AABB start = mover.hitbox();
    const AABB swept = start.merged(start.translated(delta)).expanded(m_broadPhaseMargin);

    // Broad phase
    world.query(swept, m_candidates);

    std::vector<const Entity*> solids;
    std::vector<const Entity*> triggers;
    solids.reserve(m_candidates.size());
    for (EntityID id : m_candidates) {
        if (id == mover.id) continue;
        const Entity* other = world.find(id);
        if (other == nullptr) continue;
        if (other->isSolid()) {
            solids.push_back(other);
        } else if (other->isTrigger()) {
            triggers.push_back(other);
        }
    }

    // Pre-existing overlap (spawn, knockback) is pushed out before sweeping
    const Vector2D pushOut = pushOutOfSolids(start, solids, result);
    const AABB box = start.translated(pushOut);

    // Vertical pass first; x-overlap is tested where the mover is when it crosses the surface
    const Entity* verticalHit = nullptr;
    const float dy = sweepVertical(box, delta, solids, verticalHit);
    if (verticalHit != nullptr) {
        result.velocity.setY(0.0f);
        if (delta.getY() > 0.0f) {
            result.grounded = true;
            if (!mover.grounded) {
                GameEvent landing;
                landing.type = GameEventType::PlatformLanding;
                landing.subject = mover.id;
                landing.other = verticalHit->id;
                landing.otherKind = verticalHit->kind;
                landing.position = Vector2D(mover.position.getX(), verticalHit->position.getY() -
                                                                       mover.hitboxSize.getY());
                result.events.push_back(landing);
            }
        } else {
            result.hitCeiling = true;
        }
    } else if (delta.getY() == 0.0f && supportedBelow(box, solids)) {
        result.grounded = true;
    }

    // Horizontal pass at the corrected height
    const AABB afterVertical = box.translated(Vector2D(0.0f, dy));
    const Entity* horizontalHit = nullptr;
    const float dx = sweepHorizontal(afterVertical, delta.getX(), solids, horizontalHit);
    if (horizontalHit != nullptr) {
        result.velocity.setX(0.0f);
        result.hitWall = true;
    }

    result.correctedDelta = pushOut + Vector2D(dx, dy);

    // Triggers only matter for the player; enemies pass through each other
    if (mover.kind == EntityKind::Player && !triggers.empty()) {
        for (const Entity* other : triggers) {
            if (!start.sweepIntersects(result.correctedDelta, other->hitbox())) continue;

            GameEvent event;
            event.type = triggerEventFor(other->kind);
            event.subject = mover.id;
            event.other = other->id;
            event.otherKind = other->kind;
            event.otherVariant = other->variant;
            event.position = mover.position + result.correctedDelta;
            result.events.push_back(event);
        }
    }

    return result;
}

Vector2D CollisionResolver::pushOutOfSolids(const AABB& box, const std::vector<const Entity*>& solids,
                                            ResolveResult& result) const {
    Vector2D correction;
    AABB current = box;

    for (const Entity* solid : solids) {
        const AABB other = solid->hitbox();
        const float ox = current.overlapX(other);
        const float oy = current.overlapY(other);
        if (ox <= m_skin || oy <= m_skin) continue;

        // Smaller penetration wins; near-ties go vertical
        if (oy <= ox + m_skin) {
            const bool fromAbove = current.center.getY() <= other.center.getY();
            const float shift = fromAbove ? -(current.bottom() - other.top())
                                          : (other.bottom() - current.top());
            correction += Vector2D(0.0f, shift);
            if (fromAbove) {
                result.grounded = true;
                result.velocity.setY(std::min(result.velocity.getY(), 0.0f));
            } else {
                result.velocity.setY(std::max(result.velocity.getY(), 0.0f));
            }
            current = current.translated(Vector2D(0.0f, shift));
        } else {
            const bool fromLeft = current.center.getX() <= other.center.getX();
            const float shift = fromLeft ? -(current.right() - other.left())
                                         : (other.right() - current.left());
            correction += Vector2D(shift, 0.0f);
            result.velocity.setX(0.0f);
            current = current.translated(Vector2D(shift, 0.0f));
        }

        COLLISION_DEBUG(std::format("Pushed out of platform {} by ({:.2f}, {:.2f})", solid->id,
                                    correction.getX(), correction.getY()));
    }

    return correction;
}

float CollisionResolver::sweepVertical(const AABB& box, const Vector2D& delta,
                                       const std::vector<const Entity*>& solids,
                                       const Entity*& hit) const {
    hit = nullptr;
    const float dy = delta.getY();
    float allowed = dy;

    if (dy > 0.0f) {
        for (const Entity* solid : solids) {
            const AABB other = solid->hitbox();
            // Surface must lie between the feet before and after the move
            if (other.top() < box.bottom() - m_skin) continue;
            if (other.top() > box.bottom() + allowed) continue;
            const float t = crossingTime(box.bottom(), other.top(), dy);
            if (!overlapsOnX(box.translated(Vector2D(delta.getX() * t, 0.0f)), other)) continue;
            allowed = std::max(0.0f, other.top() - box.bottom());
            hit = solid;
        }
    } else if (dy < 0.0f) {
        for (const Entity* solid : solids) {
            const AABB other = solid->hitbox();
            if (other.bottom() > box.top() + m_skin) continue;
            if (other.bottom() < box.top() + allowed) continue;
            const float t = crossingTime(box.top(), other.bottom(), dy);
            if (!overlapsOnX(box.translated(Vector2D(delta.getX() * t, 0.0f)), other)) continue;
            allowed = std::min(0.0f, other.bottom() - box.top());
            hit = solid;
        }
    }

    return allowed;
}

float CollisionResolver::sweepHorizontal(const AABB& box, float dx,
                                         const std::vector<const Entity*>& solids,
                                         const Entity*& hit) const {
    hit = nullptr;
    float allowed = dx;

    if (dx > 0.0f) {
        for (const Entity* solid : solids) {
            const AABB other = solid->hitbox();
            if (!overlapsOnY(box, other, m_skin)) continue;
            if (other.left() < box.right() - m_skin) continue;
            if (other.left() > box.right() + allowed) continue;
            allowed = std::max(0.0f, other.left() - box.right());
            hit = solid;
        }
    } else if (dx < 0.0f) {
        for (const Entity* solid : solids) {
            const AABB other = solid->hitbox();
            if (!overlapsOnY(box, other, m_skin)) continue;
            if (other.right() > box.left() + m_skin) continue;
            if (other.right() < box.left() + allowed) continue;
            allowed = std::min(0.0f, other.right() - box.left());
            hit = solid;
        }
    }

    return allowed;
}

bool CollisionResolver::supportedBelow(const AABB& box, const std::vector<const Entity*>& solids) const {
    for (const Entity* solid : solids) {
        const AABB other = solid->hitbox();
        if (overlapsOnX(box, other) && std::fabs(other.top() - box.bottom()) <= m_skin) {
            return true;
        }
    }
    return false;
}

} // namespace Skybound
