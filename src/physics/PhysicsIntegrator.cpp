/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "physics/PhysicsIntegrator.hpp"
#include <algorithm>

namespace Skybound {

PhysicsIntegrator::PhysicsIntegrator(const PhysicsConfig& config) : m_config(config) {}

IntegrationResult PhysicsIntegrator::step(const Vector2D& velocity, const Vector2D& acceleration,
                                          bool horizontalInput, const PhysicsConfig& config,
                                          float dt, float gravityScale) {
    float vx = velocity.getX();
    float vy = velocity.getY();

    if (horizontalInput) {
        vx += acceleration.getX() * dt;
    } else {
        // Geometric decay, never snapped to zero
        vx *= std::max(0.0f, 1.0f - config.friction * dt);
    }
    vy += (config.gravity * gravityScale + acceleration.getY()) * dt;

    vx = std::clamp(vx, -config.maxHorizontalSpeed, config.maxHorizontalSpeed);
    vy = std::clamp(vy, -config.maxVerticalSpeed, config.maxVerticalSpeed);

    IntegrationResult result;
    result.velocity = Vector2D(vx, vy);
    result.delta = result.velocity * dt;
    return result;
}

IntegrationResult PhysicsIntegrator::integrate(const Entity& entity, float dt) const {
    if (entity.isStatic) {
        return IntegrationResult{};
    }
    return step(entity.velocity, entity.acceleration, entity.horizontalInput, m_config, dt,
                entity.gravityScale);
}

} // namespace Skybound
