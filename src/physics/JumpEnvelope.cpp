/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "physics/JumpEnvelope.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace Skybound {

namespace {
constexpr int MAX_ARC_TICKS = 100000;
// Absorbs float drift from summing per-tick steps back to the takeoff height
constexpr float LANDING_EPSILON = 1e-3f;
}

JumpEnvelope JumpEnvelope::fromPhysics(const PhysicsConfig& physics) {
    if (!(physics.gravity > 0.0f)) {
        throw std::invalid_argument(
            std::format("gravity must be positive, got {}", physics.gravity));
    }
    if (!(physics.jumpSpeed > 0.0f)) {
        throw std::invalid_argument(
            std::format("jumpSpeed must be positive, got {}", physics.jumpSpeed));
    }
    if (!(physics.maxHorizontalSpeed > 0.0f) || !(physics.maxVerticalSpeed > 0.0f)) {
        throw std::invalid_argument(
            std::format("terminal speeds must be positive, got horizontal {} vertical {}",
                        physics.maxHorizontalSpeed, physics.maxVerticalSpeed));
    }

    JumpEnvelope env;
    env.m_horizontalSpeed = physics.maxHorizontalSpeed;
    env.m_gravity = physics.gravity;
    env.m_maxFallSpeed = physics.maxVerticalSpeed;

    // Launch speed is clamped by the integrator before the first move
    float vy = -std::min(physics.jumpSpeed, physics.maxVerticalSpeed);
    float y = 0.0f;
    env.m_arc.push_back(0.0f);

    for (int tick = 1; tick <= MAX_ARC_TICKS; ++tick) {
        vy = std::clamp(vy + physics.gravity, -physics.maxVerticalSpeed,
                        physics.maxVerticalSpeed);
        y += vy;
        env.m_arc.push_back(-y);

        if (-y > env.m_maxHeight) {
            env.m_maxHeight = -y;
            env.m_apexTick = tick;
        }
        if (y >= -LANDING_EPSILON) {
            env.m_airTicks = tick;
            break;
        }
    }

    env.m_landingSpeed = vy;
    env.m_maxDistance = static_cast<float>(env.m_airTicks) * physics.maxHorizontalSpeed;
    return env;
}

JumpEnvelope JumpEnvelope::effective(const PhysicsConfig& physics) {
    JumpEnvelope env = fromPhysics(physics);
    if (physics.maxJumpHeight > 0.0f) {
        env.m_maxHeight = std::min(env.m_maxHeight, physics.maxJumpHeight);
    }
    if (physics.maxJumpDistance > 0.0f) {
        env.m_maxDistance = std::min(env.m_maxDistance, physics.maxJumpDistance);
    }
    return env;
}

float JumpEnvelope::arcHeightAtTick(int tick) const {
    if (tick < static_cast<int>(m_arc.size())) {
        return m_arc[static_cast<size_t>(tick)];
    }
    // Past the sampled arc the fall continues at terminal speed or below
    float height = m_arc.back();
    float vy = m_landingSpeed;
    for (int t = static_cast<int>(m_arc.size()); t <= tick; ++t) {
        vy = std::min(vy + m_gravity, m_maxFallSpeed);
        height -= vy;
    }
    return height;
}

float JumpEnvelope::heightAt(float horizontal) const {
    if (horizontal <= 0.0f) {
        return m_maxHeight;
    }
    // Moving slower than full speed lets the player reach the same spot later,
    // so anything up to the apex stays available
    const int ticksNeeded = static_cast<int>(std::ceil(horizontal / m_horizontalSpeed));
    const int tick = std::max(ticksNeeded, m_apexTick);
    return std::min(arcHeightAtTick(tick), m_maxHeight);
}

} // namespace Skybound
