/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_HASH_HPP
#define SPATIAL_HASH_HPP

#include <unordered_map>
#include <vector>
#include <cstdint>
#include <functional>
#include "collisions/AABB.hpp"
#include "entities/Entity.hpp"

namespace Skybound {

/**
 * Uniform grid broad phase. Entities are bucketed into every cell their
 * hitbox overlaps; queries return each candidate once, sorted by id so the
 * narrow phase visits them in a stable order.
 */
class SpatialHash {
public:
    explicit SpatialHash(float cellSize = 64.0f);

    void insert(EntityID id, const AABB& aabb);
    void remove(EntityID id);
    void update(EntityID id, const AABB& aabb);
    void query(const AABB& area, std::vector<EntityID>& out) const;
    void clear();

    bool contains(EntityID id) const { return m_aabbs.find(id) != m_aabbs.end(); }
    size_t size() const { return m_aabbs.size(); }
    float getCellSize() const { return m_cellSize; }

private:
    struct CellCoord { int x; int y; };
    struct CellCoordHash {
        size_t operator()(const CellCoord& c) const noexcept {
            return (static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32) ^
                   static_cast<uint32_t>(c.y);
        }
    };
    struct CellCoordEq {
        bool operator()(const CellCoord& a, const CellCoord& b) const noexcept {
            return a.x == b.x && a.y == b.y;
        }
    };
    struct CellRange { int minX; int maxX; int minY; int maxY; };

    using CellVector = std::vector<EntityID>;

    float m_cellSize{64.0f};
    std::unordered_map<EntityID, AABB> m_aabbs; // latest bounds per id
    std::unordered_map<CellCoord, CellVector, CellCoordHash, CellCoordEq> m_cells;

    CellRange cellRange(const AABB& aabb) const;
    void forEachOverlappingCell(const AABB& aabb, const std::function<void(CellCoord)>& fn) const;
    void eraseFromCell(const CellCoord& c, EntityID id);
};

} // namespace Skybound

#endif // SPATIAL_HASH_HPP
