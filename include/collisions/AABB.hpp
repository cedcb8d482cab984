/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include "utils/Vector2D.hpp"

namespace Skybound {

struct AABB {
    Vector2D center;   // world center
    Vector2D halfSize; // half extents (w/2, h/2)

    AABB() = default;
    AABB(float cx, float cy, float hw, float hh) : center(cx, cy), halfSize(hw, hh) {}

    static AABB fromTopLeft(const Vector2D& topLeft, float width, float height) {
        return AABB(topLeft.getX() + width * 0.5f, topLeft.getY() + height * 0.5f,
                    width * 0.5f, height * 0.5f);
    }

    float left() const { return center.getX() - halfSize.getX(); }
    float right() const { return center.getX() + halfSize.getX(); }
    float top() const { return center.getY() - halfSize.getY(); }
    float bottom() const { return center.getY() + halfSize.getY(); }
    float width() const { return halfSize.getX() * 2.0f; }
    float height() const { return halfSize.getY() * 2.0f; }

    bool intersects(const AABB& other) const;
    bool contains(const Vector2D& p) const;
    bool contains(const AABB& other) const;

    // Smallest box covering both this and other
    AABB merged(const AABB& other) const;
    AABB expanded(float margin) const;
    AABB translated(const Vector2D& delta) const;

    /**
     * Swept test: does this box, moved linearly by delta, overlap other at
     * any point of the move? Touching edges do not count.
     */
    bool sweepIntersects(const Vector2D& delta, const AABB& other) const;

    // Penetration depth along each axis; zero on an axis that does not overlap
    float overlapX(const AABB& other) const;
    float overlapY(const AABB& other) const;
};

} // namespace Skybound

#endif // AABB_HPP
