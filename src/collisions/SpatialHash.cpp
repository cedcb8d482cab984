/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/SpatialHash.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace Skybound {

SpatialHash::SpatialHash(float cellSize) : m_cellSize(cellSize) {
    if (!(cellSize > 0.0f)) {
        throw std::invalid_argument(
            std::format("SpatialHash cell size must be positive, got {}", cellSize));
    }
}

void SpatialHash::insert(EntityID id, const AABB& aabb) {
    if (contains(id)) {
        update(id, aabb);
        return;
    }
    m_aabbs[id] = aabb;
    forEachOverlappingCell(aabb, [&](CellCoord c) {
        auto& cell = m_cells[c];
        if (cell.capacity() == 0) {
            cell.reserve(8);
        }
        cell.push_back(id);
    });
}

void SpatialHash::remove(EntityID id) {
    auto it = m_aabbs.find(id);
    if (it == m_aabbs.end()) return;
    const AABB aabb = it->second;
    forEachOverlappingCell(aabb, [&](CellCoord c) { eraseFromCell(c, id); });
    m_aabbs.erase(it);
}

void SpatialHash::update(EntityID id, const AABB& newAABB) {
    auto it = m_aabbs.find(id);
    if (it == m_aabbs.end()) {
        insert(id, newAABB);
        return;
    }

    const CellRange oldRange = cellRange(it->second);
    const CellRange newRange = cellRange(newAABB);
    it->second = newAABB;

    // Early exit if entity didn't change cells
    if (oldRange.minX == newRange.minX && oldRange.maxX == newRange.maxX &&
        oldRange.minY == newRange.minY && oldRange.maxY == newRange.maxY) {
        return;
    }

    auto inRange = [](const CellRange& r, int x, int y) {
        return x >= r.minX && x <= r.maxX && y >= r.minY && y <= r.maxY;
    };

    for (int y = oldRange.minY; y <= oldRange.maxY; ++y) {
        for (int x = oldRange.minX; x <= oldRange.maxX; ++x) {
            if (!inRange(newRange, x, y)) {
                eraseFromCell(CellCoord{x, y}, id);
            }
        }
    }

    for (int y = newRange.minY; y <= newRange.maxY; ++y) {
        for (int x = newRange.minX; x <= newRange.maxX; ++x) {
            if (!inRange(oldRange, x, y)) {
                m_cells[CellCoord{x, y}].push_back(id);
            }
        }
    }
}

void SpatialHash::query(const AABB& area, std::vector<EntityID>& out) const {
    out.clear();

    const CellRange range = cellRange(area);
    for (int y = range.minY; y <= range.maxY; ++y) {
        for (int x = range.minX; x <= range.maxX; ++x) {
            auto it = m_cells.find(CellCoord{x, y});
            if (it == m_cells.end()) continue;
            out.insert(out.end(), it->second.begin(), it->second.end());
        }
    }

    // Entities spanning several cells show up once per cell
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
}

void SpatialHash::clear() {
    m_cells.clear();
    m_aabbs.clear();
}

SpatialHash::CellRange SpatialHash::cellRange(const AABB& aabb) const {
    return CellRange{
        static_cast<int>(std::floor(aabb.left() / m_cellSize)),
        static_cast<int>(std::floor(aabb.right() / m_cellSize)),
        static_cast<int>(std::floor(aabb.top() / m_cellSize)),
        static_cast<int>(std::floor(aabb.bottom() / m_cellSize))};
}

void SpatialHash::forEachOverlappingCell(const AABB& aabb, const std::function<void(CellCoord)>& fn) const {
    const CellRange range = cellRange(aabb);
    for (int y = range.minY; y <= range.maxY; ++y) {
        for (int x = range.minX; x <= range.maxX; ++x) {
            fn(CellCoord{x, y});
        }
    }
}

void SpatialHash::eraseFromCell(const CellCoord& c, EntityID id) {
    auto cit = m_cells.find(c);
    if (cit == m_cells.end()) return;
    auto& v = cit->second;
    v.erase(std::remove(v.begin(), v.end(), id), v.end());
    if (v.empty()) m_cells.erase(cit);
}

} // namespace Skybound
