/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/PlayerState.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace Skybound {

PlayerState::PlayerState(const SessionConfig& config) : m_config(config) {
    reset();
}

void PlayerState::reset() {
    m_health = std::clamp(m_config.startHealth, 1, std::max(1, m_config.maxHealth));
    m_coins = 0;
    m_invincibleTicks = 0;
    m_speedBoostTicks = 0;
    m_jumpBoostTicks = 0;
    m_shieldTicks = 0;
    m_doubleJumpTicks = 0;
    m_doubleJumpUsed = false;
}

bool PlayerState::takeDamage(int amount, bool ignoreProtection) {
    if (amount <= 0) {
        return false;
    }
    if (!ignoreProtection && (hasShield() || isInvincible())) {
        return false;
    }

    m_health = std::max(0, m_health - amount);
    m_invincibleTicks = m_config.invincibilityTicks;
    PLAYER_DEBUG(std::format("Took {} damage, health now {}", amount, m_health));
    return true;
}

void PlayerState::heal(int amount) {
    m_health = std::min(m_health + std::max(0, amount), m_config.maxHealth);
}

void PlayerState::addCoins(int amount) {
    m_coins += std::max(0, amount);
}

void PlayerState::applyPowerUp(PowerUpVariant variant, int durationTicks, int value) {
    switch (variant) {
    case PowerUpVariant::SpeedBoost:
        m_speedBoostTicks = std::max(m_speedBoostTicks, durationTicks);
        break;
    case PowerUpVariant::JumpBoost:
        m_jumpBoostTicks = std::max(m_jumpBoostTicks, durationTicks);
        break;
    case PowerUpVariant::HealthPotion:
        heal(std::max(1, value));
        break;
    case PowerUpVariant::Coin:
        addCoins(std::max(1, value));
        break;
    case PowerUpVariant::Shield:
        m_shieldTicks = std::max(m_shieldTicks, durationTicks);
        break;
    case PowerUpVariant::DoubleJump:
        m_doubleJumpTicks = std::max(m_doubleJumpTicks, durationTicks);
        break;
    }
}

void PlayerState::tick() {
    auto countDown = [](int& t) {
        if (t > 0) --t;
    };
    countDown(m_invincibleTicks);
    countDown(m_speedBoostTicks);
    countDown(m_jumpBoostTicks);
    countDown(m_shieldTicks);
    countDown(m_doubleJumpTicks);
}

bool PlayerState::canDoubleJump(float velocityY, float minVelocityY) const {
    return hasDoubleJump() && !m_doubleJumpUsed && velocityY > minVelocityY;
}

float PlayerState::runAcceleration(const PhysicsConfig& physics) const {
    return hasSpeedBoost() ? physics.runAcceleration * m_config.speedBoostMultiplier
                           : physics.runAcceleration;
}

float PlayerState::jumpSpeed(const PhysicsConfig& physics) const {
    return hasJumpBoost() ? physics.boostedJumpSpeed : physics.jumpSpeed;
}

} // namespace Skybound
