/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLAYER_STATE_HPP
#define PLAYER_STATE_HPP

#include "core/GameConfig.hpp"
#include "entities/Entity.hpp"

namespace Skybound {

/**
 * Gameplay state of the player that is not part of the physics body:
 * health, coins, invincibility frames and power-up timers. Timers count
 * fixed update ticks.
 */
class PlayerState {
public:
    explicit PlayerState(const SessionConfig& config);

    void reset();

    /**
     * Applies damage unless a shield or invincibility frames block it.
     * @param ignoreProtection bypasses shield and invincibility (falling out)
     * @return true if health was lost
     */
    bool takeDamage(int amount = 1, bool ignoreProtection = false);

    void heal(int amount = 1);
    void addCoins(int amount);

    // Refreshes a timed effect to at least durationTicks; instant effects apply value
    void applyPowerUp(PowerUpVariant variant, int durationTicks, int value);

    // Advances all timers by one tick
    void tick();

    // Air-jump bookkeeping
    void onGrounded() { m_doubleJumpUsed = false; }
    bool canDoubleJump(float velocityY, float minVelocityY) const;
    void consumeDoubleJump() { m_doubleJumpUsed = true; }

    float runAcceleration(const PhysicsConfig& physics) const;
    float jumpSpeed(const PhysicsConfig& physics) const;

    int getHealth() const { return m_health; }
    int getMaxHealth() const { return m_config.maxHealth; }
    int getCoins() const { return m_coins; }
    bool isDead() const { return m_health <= 0; }
    bool isInvincible() const { return m_invincibleTicks > 0; }
    bool hasShield() const { return m_shieldTicks > 0; }
    bool hasSpeedBoost() const { return m_speedBoostTicks > 0; }
    bool hasJumpBoost() const { return m_jumpBoostTicks > 0; }
    bool hasDoubleJump() const { return m_doubleJumpTicks > 0; }

    int getInvincibleTicks() const { return m_invincibleTicks; }
    int getShieldTicks() const { return m_shieldTicks; }
    int getSpeedBoostTicks() const { return m_speedBoostTicks; }
    int getJumpBoostTicks() const { return m_jumpBoostTicks; }
    int getDoubleJumpTicks() const { return m_doubleJumpTicks; }

    // Carried across levels by the session; a death resets everything
    void setCoins(int coins) { m_coins = coins; }

private:
    SessionConfig m_config;
    int m_health{0};
    int m_coins{0};
    int m_invincibleTicks{0};
    int m_speedBoostTicks{0};
    int m_jumpBoostTicks{0};
    int m_shieldTicks{0};
    int m_doubleJumpTicks{0};
    bool m_doubleJumpUsed{false};
};

} // namespace Skybound

#endif // PLAYER_STATE_HPP
