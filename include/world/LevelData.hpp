/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEVEL_DATA_HPP
#define LEVEL_DATA_HPP

#include "collisions/AABB.hpp"
#include "entities/Entity.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Skybound {

// First id handed out to generated entities; ids below are reserved (player)
constexpr EntityID FIRST_LEVEL_ENTITY_ID = 100;

/**
 * Output of the level generator. Immutable once built: the session copies
 * it into its own working set and mutates that copy.
 */
struct Level {
    int index{1};
    uint64_t seed{0};
    std::string tierName;
    bool tutorial{false};

    AABB bounds;              // playable area; falling below it costs a life
    Vector2D startPosition;   // player hitbox top-left on spawn
    Vector2D goalPosition;    // goal hitbox top-left

    std::vector<Entity> platforms; // in placement order, left to right
    std::vector<Entity> enemies;
    std::vector<Entity> powerUps;
    Entity goal;

    size_t entityCount() const {
        return platforms.size() + enemies.size() + powerUps.size() + 1;
    }
};

} // namespace Skybound

#endif // LEVEL_DATA_HPP
