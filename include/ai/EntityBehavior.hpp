/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_BEHAVIOR_HPP
#define ENTITY_BEHAVIOR_HPP

#include "core/GameConfig.hpp"
#include "entities/Entity.hpp"
#include "entities/PlayerState.hpp"
#include "events/GameEvent.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Skybound {

// A shot requested by a behavior; the session creates the projectile
struct ProjectileShot {
    EntityID shooter{INVALID_ENTITY_ID};
    Vector2D origin; // projectile center at launch
    Vector2D target;
    float facing{1.0f};
};

/**
 * @brief Read-only view of the world handed to updateBehavior each tick
 */
struct BehaviorContext {
    const Entity* player{nullptr}; // null while the player is respawning
    const PhysicsConfig& physics;
    uint64_t tick{0};
    float deltaTime{1.0f};
    std::vector<ProjectileShot>* shots{nullptr}; // null when nothing may be spawned

    BehaviorContext(const Entity* p, const PhysicsConfig& phys, uint64_t t, float dt,
                    std::vector<ProjectileShot>* s = nullptr)
        : player(p), physics(phys), tick(t), deltaTime(dt), shots(s) {}
};

/**
 * @brief Mutable player access for onCollision, plus the event being handled
 */
struct CollisionContext {
    Entity& player;
    PlayerState& playerState;
    const SessionConfig& session;
    const GameEvent& event;

    CollisionContext(Entity& p, PlayerState& s, const SessionConfig& c, const GameEvent& e)
        : player(p), playerState(s), session(c), event(e) {}
};

enum class CollisionOutcome : uint8_t {
    None,          // nothing to do
    Consumed,      // the entity should be removed from the level
    DamagedPlayer, // player lost health
    Blocked        // contact happened but shield or invincibility absorbed it
};

/**
 * Capability interface for enemy and power-up variants.
 *
 * Behavior objects are stateless and shared by every entity of a variant;
 * anything that must persist between ticks lives in Entity::behavior.
 */
class IEntityBehavior {
public:
    virtual ~IEntityBehavior() = default;

    /**
     * Called once per Playing tick before integration. Sets the entity's
     * velocity/acceleration intent; never moves it directly. Setting
     * behavior.expired removes the entity after the behavior pass.
     */
    virtual void updateBehavior(Entity& self, const BehaviorContext& ctx) const = 0;

    // Called when the resolver reported the player touching this entity
    virtual CollisionOutcome onCollision(Entity& self, CollisionContext& ctx) const = 0;

    virtual std::string getName() const = 0;
};

} // namespace Skybound

#endif // ENTITY_BEHAVIOR_HPP
