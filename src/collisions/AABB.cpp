/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"
#include <algorithm>
#include <utility>

namespace Skybound {

bool AABB::intersects(const AABB& other) const {
    // Use non-strict separation so edge-touching is NOT a collision
    if (right() <= other.left() || other.right() <= left()) return false;
    if (bottom() <= other.top() || other.bottom() <= top()) return false;
    return true;
}

bool AABB::contains(const Vector2D& p) const {
    return p.getX() >= left() && p.getX() <= right() &&
           p.getY() >= top()  && p.getY() <= bottom();
}

bool AABB::contains(const AABB& other) const {
    return other.left() >= left() && other.right() <= right() &&
           other.top() >= top() && other.bottom() <= bottom();
}

AABB AABB::merged(const AABB& other) const {
    const float l = std::min(left(), other.left());
    const float t = std::min(top(), other.top());
    const float r = std::max(right(), other.right());
    const float b = std::max(bottom(), other.bottom());
    return AABB((l + r) * 0.5f, (t + b) * 0.5f, (r - l) * 0.5f, (b - t) * 0.5f);
}

AABB AABB::expanded(float margin) const {
    return AABB(center.getX(), center.getY(),
                halfSize.getX() + margin, halfSize.getY() + margin);
}

AABB AABB::translated(const Vector2D& delta) const {
    return AABB(center.getX() + delta.getX(), center.getY() + delta.getY(),
                halfSize.getX(), halfSize.getY());
}

bool AABB::sweepIntersects(const Vector2D& delta, const AABB& other) const {
    // Slab test of the center path against other grown by our half extents
    const float origin[2] = {center.getX(), center.getY()};
    const float dir[2] = {delta.getX(), delta.getY()};
    const float lo[2] = {other.left() - halfSize.getX(), other.top() - halfSize.getY()};
    const float hi[2] = {other.right() + halfSize.getX(), other.bottom() + halfSize.getY()};

    float tEnter = 0.0f;
    float tExit = 1.0f;
    for (int axis = 0; axis < 2; ++axis) {
        if (dir[axis] == 0.0f) {
            if (origin[axis] <= lo[axis] || origin[axis] >= hi[axis]) return false;
            continue;
        }
        float t1 = (lo[axis] - origin[axis]) / dir[axis];
        float t2 = (hi[axis] - origin[axis]) / dir[axis];
        if (t1 > t2) std::swap(t1, t2);
        tEnter = std::max(tEnter, t1);
        tExit = std::min(tExit, t2);
        if (tEnter >= tExit) return false;
    }
    return true;
}

float AABB::overlapX(const AABB& other) const {
    return std::max(0.0f, std::min(right(), other.right()) - std::max(left(), other.left()));
}

float AABB::overlapY(const AABB& other) const {
    return std::max(0.0f, std::min(bottom(), other.bottom()) - std::max(top(), other.top()));
}

} // namespace Skybound
