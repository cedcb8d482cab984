/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef JUMP_ENVELOPE_HPP
#define JUMP_ENVELOPE_HPP

#include "core/GameConfig.hpp"
#include <vector>

namespace Skybound {

/**
 * Reach of a single jump under the fixed-step integrator.
 *
 * The arc is sampled tick by tick with the same update order the integrator
 * uses (gravity applied to velocity, then velocity to position), so the
 * numbers match what a player can actually do in game rather than the
 * continuous-time formula.
 */
class JumpEnvelope {
public:
    /**
     * Derives the envelope from gravity, jump speed and terminal speeds.
     * @throws std::invalid_argument if gravity, jumpSpeed or the max speeds
     *         are not positive
     */
    static JumpEnvelope fromPhysics(const PhysicsConfig& physics);

    /**
     * Derived envelope further limited by the configured maxJumpHeight and
     * maxJumpDistance caps.
     */
    static JumpEnvelope effective(const PhysicsConfig& physics);

    float maxHeight() const { return m_maxHeight; }
    float maxDistance() const { return m_maxDistance; }
    int airTicks() const { return m_airTicks; }
    int apexTick() const { return m_apexTick; }

    /**
     * Highest rise that can still be landed on after covering the given
     * horizontal distance at full run speed. Negative once the arc has
     * dropped below the takeoff height.
     */
    float heightAt(float horizontal) const;

private:
    JumpEnvelope() = default;

    std::vector<float> m_arc; // height above takeoff after each tick, m_arc[0] == 0
    float m_maxHeight{0.0f};
    float m_maxDistance{0.0f};
    float m_horizontalSpeed{0.0f};
    float m_gravity{0.0f};
    float m_maxFallSpeed{0.0f};
    float m_landingSpeed{0.0f};
    int m_airTicks{0};
    int m_apexTick{0};

    float arcHeightAtTick(int tick) const;
};

} // namespace Skybound

#endif // JUMP_ENVELOPE_HPP
