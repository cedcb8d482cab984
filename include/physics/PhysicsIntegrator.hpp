/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHYSICS_INTEGRATOR_HPP
#define PHYSICS_INTEGRATOR_HPP

#include "core/GameConfig.hpp"
#include "entities/Entity.hpp"
#include "utils/Vector2D.hpp"

namespace Skybound {

struct IntegrationResult {
    Vector2D velocity; // velocity after this step
    Vector2D delta;    // tentative displacement, not yet collision checked
};

/**
 * Semi-implicit Euler step for moving entities.
 *
 * Gravity (scaled per entity) and the entity's own acceleration (run input or AI) update the
 * velocity first. While the entity has no horizontal input its horizontal
 * velocity decays geometrically by the friction coefficient instead.
 * Velocity is clamped to the terminal speeds and the tentative delta is
 * velocity * dt. Position is never touched here.
 */
class PhysicsIntegrator {
public:
    explicit PhysicsIntegrator(const PhysicsConfig& config);

    IntegrationResult integrate(const Entity& entity, float dt) const;

    // gravityScale 0 gives a straight-line mover (projectiles)
    static IntegrationResult step(const Vector2D& velocity, const Vector2D& acceleration,
                                  bool horizontalInput, const PhysicsConfig& config, float dt,
                                  float gravityScale = 1.0f);

    const PhysicsConfig& getConfig() const { return m_config; }

private:
    PhysicsConfig m_config;
};

} // namespace Skybound

#endif // PHYSICS_INTEGRATOR_HPP
